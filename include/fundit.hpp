#pragma once

#include "fundit/fundit.hpp"

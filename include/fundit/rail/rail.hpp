#pragma once

#include <fundit/rail/transfer.hpp>
#include <functional>

namespace fundit::rail {

    using ReplyHandler = std::function<void(RailReply)>;

    /// Transport to the external ledger. submit() may invoke on_reply before returning
    /// or at any later point, from any thread. Once submitted a transfer cannot be withdrawn.
    class Rail {
      public:
        virtual ~Rail() = default;

        virtual void submit(const TransferRequest &request, ReplyHandler on_reply) = 0;
    };

} // namespace fundit::rail

#pragma once

#include <cstdint>
#include <vector>

#include "dshare/client/logger.hpp"
#include "dshare/client/progress_reporter.hpp"
#include "dshare/client/remote_store.hpp"
#include "dshare/client/retry_policy.hpp"
#include "dshare/client/transfer_state.hpp"
#include "dshare/client/transfer_types.hpp"

namespace dshare::client
{

    class Finalizer
    {
    public:
        Finalizer(RemoteStore &store, RetryPolicy &retry, Logger logger);

        // Completes the session. A conflict listing missing chunks triggers a single sequential recovery
        // pass followed by one more completion; anything short of success after that is terminal.
        void complete(const FileDescriptor &file, const UploadSession &session, TransferState &state,
                      ProgressReporter &progress);

    private:
        CompletionReply request_completion(const std::string &upload_id, bool accept_conflict);
        void recover(const FileDescriptor &file, const UploadSession &session, TransferState &state,
                     ProgressReporter &progress, const std::vector<std::int64_t> &missing);

        RemoteStore &store_;
        RetryPolicy &retry_;
        Logger logger_;
    };

} // namespace dshare::client

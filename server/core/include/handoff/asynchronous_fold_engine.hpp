#ifndef HANDOFF_ASYNCHRONOUS_FOLD_ENGINE_HPP
#define HANDOFF_ASYNCHRONOUS_FOLD_ENGINE_HPP

/// \file

#include "handoff/handoff_collaborators.hpp"

namespace handoff
{
    class thread_pool;

    /// Runs another fold engine on a worker pool while the caller blocks.
    ///
    /// A handoff::exception raised by the fold is rethrown unchanged. Any other failure,
    /// including a worker which is destroyed before running the fold, is rethrown as
    /// HANDOFF_FOLD_ENGINE_ERR.
    class asynchronous_fold_engine : public fold_engine
    {
    public:
        asynchronous_fold_engine(fold_engine& _engine, thread_pool& _pool) noexcept
            : engine_{_engine}
            , pool_{_pool}
        {
        }

        auto fold(const partition_id& _partition, const visit_function& _visit, transfer_state _initial)
            -> transfer_state override;

    private:
        fold_engine& engine_;
        thread_pool& pool_;
    }; // class asynchronous_fold_engine
} // namespace handoff

#endif // HANDOFF_ASYNCHRONOUS_FOLD_ENGINE_HPP

#include "handoff/asynchronous_fold_engine.hpp"

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_logger.hpp"
#include "handoff/thread_pool.hpp"

#include <fmt/format.h>

#include <future>
#include <memory>

namespace handoff
{
    auto asynchronous_fold_engine::fold(const partition_id& _partition,
                                        const visit_function& _visit,
                                        transfer_state _initial) -> transfer_state
    {
        // The caller blocks until the task finishes or is destroyed, so the references stay valid.
        auto task = std::make_shared<std::packaged_task<transfer_state()>>(
            [this, &_partition, &_visit, initial = std::move(_initial)]() mutable {
                return engine_.fold(_partition, _visit, std::move(initial));
            });

        auto result = task->get_future();

        thread_pool::post(pool_, [task = std::move(task)] { (*task)(); });

        try {
            return result.get();
        }
        catch (const handoff::exception&) {
            throw;
        }
        catch (const std::exception& e) {
            log::sender::error("fold of partition [{}] failed on worker: {}", _partition.str(), e.what());
            THROW(HANDOFF_FOLD_ENGINE_ERR, fmt::format("fold of partition [{}] failed: {}", _partition.str(), e.what()));
        }
    } // fold
} // namespace handoff

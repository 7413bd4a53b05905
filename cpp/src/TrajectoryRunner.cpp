#include "TrajectoryRunner.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "Exceptions.h"
#include "Logger.h"

using namespace ensemble;

namespace {
    using Clock = std::chrono::steady_clock;

    double secondsSince(const Clock::time_point start) {
        return std::chrono::duration<double>(Clock::now() - start).count();
    }
}

TrajectoryRunner::TrajectoryRunner(const MultiTrajResult& prototype,
                                   Generator generator,
                                   const std::int64_t numTrajectories,
                                   const int chunkSize,
                                   const int maxWorkers,
                                   const std::uint64_t baseSeed,
                                   const double timeout)
    : prototype_(prototype),
      generator_(std::move(generator)),
      numTrajectories_(numTrajectories),
      chunkSize_(chunkSize),
      maxWorkers_(maxWorkers),
      baseSeed_(baseSeed),
      timeout_(timeout) {
    if (!generator_) throw ConfigurationError("TrajectoryRunner", "no trajectory generator");
    if (numTrajectories_ < 1 || chunkSize_ < 1 || maxWorkers_ < 1)
        throw ConfigurationError("TrajectoryRunner", "trajectory count, chunk size and worker count must be >= 1");
    if (!(timeout_ >= 0.0)) throw ConfigurationError("TrajectoryRunner", "timeout must be >= 0");
    if (prototype_.numTrajectories() != 0)
        throw ConfigurationError("TrajectoryRunner", "the prototype aggregation must be empty");
}

MultiTrajResult TrajectoryRunner::run() const {
    Logger::getInstance().info("TrajectoryRunner", "running " + std::to_string(numTrajectories_) +
                                                   " trajectories on " + std::to_string(maxWorkers_) + " worker(s)");
    const auto start = Clock::now();

    MultiTrajResult result = maxWorkers_ == 1 ? runSequential() : runParallel();
    result.addRunTime(secondsSince(start));

    Logger::getInstance().info("TrajectoryRunner", "aggregated " + std::to_string(result.numTrajectories()) +
                                                   " trajectories, " + toString(result.endCondition()));
    return result;
}

MultiTrajResult TrajectoryRunner::runSequential() const {
    const auto start = Clock::now();
    MultiTrajResult result(prototype_);
    for (std::int64_t i = 0; i < numTrajectories_; ++i) {
        const double left = result.add(generator_(baseSeed_ + static_cast<std::uint64_t>(i)));
        if (left <= 0.0) break;
        if (secondsSince(start) >= timeout_) break;
    }
    return result;
}

MultiTrajResult TrajectoryRunner::runParallel() const {
    const auto start = Clock::now();

    // workers cannot share the end condition: only its trajectory bound is enforced
    std::int64_t total = numTrajectories_;
    if (const auto target = prototype_.targetNtraj()) {
        if (*target < total) {
            Logger::getInstance().info("TrajectoryRunner", "end condition caps the run at " +
                                                           std::to_string(*target) + " trajectories");
            total = *target;
        }
    }
    if (prototype_.hasToleranceTarget())
        Logger::getInstance().warning("TrajectoryRunner", "target tolerance is not evaluated across " +
                                                          std::to_string(maxWorkers_) + " workers, running " +
                                                          std::to_string(total) + " trajectories");

    const std::int64_t nChunks = (total + chunkSize_ - 1) / chunkSize_;
    std::atomic<std::int64_t> nextChunk{0};
    std::atomic<bool> stop{false};

    std::mutex failureMutex;
    std::exception_ptr failure;

    struct WorkerCtx {
        MultiTrajResult result;
        std::thread thread;
    };
    std::vector<WorkerCtx> workers;
    workers.reserve(maxWorkers_);

    for (int w = 0; w < maxWorkers_; ++w) {
        workers.push_back({prototype_, {}});
        auto& wk = workers.back();
        wk.thread = std::thread([&wk, &nextChunk, &stop, &failureMutex, &failure, nChunks, total, start, w, this] {
            try {
                while (!stop.load(std::memory_order_relaxed)) {
                    const std::int64_t chunkIdx = nextChunk.fetch_add(1, std::memory_order_relaxed);
                    if (chunkIdx >= nChunks) break;

                    const std::int64_t first = chunkIdx * chunkSize_;
                    const std::int64_t last = std::min(first + chunkSize_, total);
                    for (std::int64_t i = first; i < last; ++i) {
                        if (secondsSince(start) >= timeout_) {
                            stop.store(true, std::memory_order_relaxed);
                            break;
                        }
                        wk.result.add(generator_(baseSeed_ + static_cast<std::uint64_t>(i)));
                    }
                }
            }
            catch (const std::exception& e) {
                Logger::getInstance().error("TrajectoryRunner", "worker " + std::to_string(w) + " failed: " + e.what());
                stop.store(true, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(failureMutex);
                if (!failure) failure = std::current_exception();
            }
            catch (...) {
                Logger::getInstance().error("TrajectoryRunner", "worker " + std::to_string(w) + " failed");
                stop.store(true, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(failureMutex);
                if (!failure) failure = std::current_exception();
            }
        });
    }

    for (auto& wk : workers) wk.thread.join();
    if (failure) std::rethrow_exception(failure);

    std::vector<MultiTrajResult> partials;
    partials.reserve(workers.size());
    for (auto& wk : workers) partials.push_back(std::move(wk.result));
    return mergeAll(std::move(partials));
}

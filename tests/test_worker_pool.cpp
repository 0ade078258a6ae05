/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: test_worker_pool.cpp

    Description:
        Multi-process tests for WorkerPool and the stock pipeline stages.
        Every test forks real replica processes.

        Test Coverage:
        - Test 1:  Creation rejects an empty list and null specifications
        - Test 2:  Two-stage pipeline delivers 2, 4, 6, 8, 10 in order
        - Test 3:  Shared control signals are counted once
        - Test 4:  request_exit_all() terminates a paused replica
        - Test 5:  Pause/resume loses and duplicates nothing
        - Test 6:  Replica ignoring exit is reported HUNG, join stays bounded
        - Test 7:  Early return, exception and crash are each reported
        - Test 8:  Replicas of one specification run as distinct processes
        - Test 9:  start_workers() twice is rejected
        - Test 10: reset_controls() refused while replicas run
        - Test 11: put_until_exit() drops a message that can never fit
        - Test 12: Stages keep running behind a channel too small for them
        - Test 13: Setup failure reported even when exit arrives first
*******************************************************************************/

#include "worker/worker_pool.h"
#include "common/logger.h"
#include "common/message.h"
#include "stages/pipeline_stages.h"

#include <unistd.h>
#include <algorithm>
#include <cassert>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <thread>

using namespace pipeline;
using std::chrono::milliseconds;

//==============================================================================
// Test Infrastructure
//==============================================================================

static long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<long>(std::chrono::duration_cast<milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

/// Read up to @p expected integers from @p channel, giving up after @p timeout.
static std::vector<int64_t> collect_integers(BoundedChannel& channel, size_t expected,
                                             milliseconds timeout) {
    std::vector<int64_t> values;
    auto start = std::chrono::steady_clock::now();
    while (values.size() < expected && elapsed_ms(start) < timeout.count()) {
        auto message = channel.get_message(true, milliseconds(100));
        if (!message) continue;
        auto* integer = dynamic_cast<IntegerMessage*>(message.get());
        if (integer) {
            values.push_back(integer->value);
        }
    }
    return values;
}

/// Cooperative body that only honours pause and exit.
static void idle_body(const StaticArgs&, const ChannelList&, const ChannelList&,
                      ControlSignal& control) {
    while (!control.is_exit_requested()) {
        control.check_pause();
        std::this_thread::sleep_for(milliseconds(10));
    }
}

/// Build counter source -> Q -> scale -> R sharing @p control.
static std::unique_ptr<WorkerPool> make_scaling_pool(std::shared_ptr<ControlSignal> control,
                                                     ChannelPtr q, ChannelPtr r,
                                                     int64_t count, milliseconds period) {
    WorkerSpecPtr source;
    WorkerSpecPtr scale;
    std::unique_ptr<WorkerPool> pool;
    if (!WorkerSpecification::create("counter_source_worker", counter_source_worker, 1,
                                     {int64_t(1), count, period},
                                     {}, {q}, control, source) ||
        !WorkerSpecification::create("scale_worker", scale_worker, 1, {int64_t(2)},
                                     {q}, {r}, control, scale) ||
        !WorkerPool::create({source, scale}, pool)) {
        throw std::runtime_error("pool setup failed");
    }
    return pool;
}

//==============================================================================
// Test Runner
//==============================================================================

int main() {
    Logger::set_level(LogLevel::WARNING);

    int passed = 0;
    int failed = 0;

    //--------------------------------------------------------------------------
    // Test 1
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 1: Pool creation validation... ";
        try {
            Logger::set_level(LogLevel::ERROR);
            std::unique_ptr<WorkerPool> pool;
            assert(!WorkerPool::create({}, pool));
            assert(!pool);
            assert(!WorkerPool::create({WorkerSpecPtr()}, pool));
            assert(!pool);
            Logger::set_level(LogLevel::WARNING);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 2: A writes 1..5 into Q, B doubles into R
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 2: Two-stage pipeline... ";
        try {
            auto control = ControlSignal::create();
            auto q = BoundedChannel::create(10);
            auto r = BoundedChannel::create(10);
            assert(control && q && r);

            auto pool = make_scaling_pool(control, q, r, 5, milliseconds(0));
            assert(pool->replica_count() == 2);
            assert(pool->start_workers());
            assert(pool->is_started());

            auto values = collect_integers(*r, 5, milliseconds(5000));
            assert((values == std::vector<int64_t>{2, 4, 6, 8, 10}));

            pool->request_exit_all();
            q->drain();
            r->drain();
            JoinReport report = pool->join_all(milliseconds(2000));
            assert(report.replicas.size() == 2);
            assert(report.all_clean());
            assert(report.replicas[0].worker_name == "counter_source_worker");
            assert(report.replicas[1].worker_name == "scale_worker");

            assert(pool->reset_controls());
            assert(!control->is_exit_requested());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 3
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 3: Shared control signals... ";
        try {
            auto shared = ControlSignal::create();
            auto other = ControlSignal::create();
            assert(shared && other);

            WorkerSpecPtr a, b, c;
            assert(WorkerSpecification::create("a", idle_body, 1, {}, {}, {}, shared, a));
            assert(WorkerSpecification::create("b", idle_body, 2, {}, {}, {}, shared, b));
            assert(WorkerSpecification::create("c", idle_body, 1, {}, {}, {}, other, c));

            std::unique_ptr<WorkerPool> pool;
            assert(WorkerPool::create({a, b, c}, pool));
            assert(pool->replica_count() == 4);
            assert(pool->control_signal_count() == 2);

            assert(pool->start_workers());
            pool->request_exit_all();
            assert(shared->is_exit_requested());
            assert(other->is_exit_requested());

            JoinReport report = pool->join_all(milliseconds(2000));
            assert(report.all_clean());
            assert(pool->alive_count() == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 4
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 4: Exit while paused... ";
        try {
            auto control = ControlSignal::create(milliseconds(20));
            assert(control);
            WorkerSpecPtr spec;
            assert(WorkerSpecification::create("idle", idle_body, 1, {}, {}, {}, control, spec));
            std::unique_ptr<WorkerPool> pool;
            assert(WorkerPool::create({spec}, pool));

            control->pause();
            assert(pool->start_workers());
            std::this_thread::sleep_for(milliseconds(300));
            assert(pool->alive_count() == 1);

            auto start = std::chrono::steady_clock::now();
            pool->request_exit_all();
            JoinReport report = pool->join_all(milliseconds(3000));
            assert(report.all_clean());
            assert(elapsed_ms(start) < 2000);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 5
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 5: Pause and resume... ";
        try {
            auto control = ControlSignal::create(milliseconds(20));
            auto q = BoundedChannel::create(10);
            auto r = BoundedChannel::create(0);
            assert(control && q && r);

            auto pool = make_scaling_pool(control, q, r, 20, milliseconds(5));
            assert(pool->start_workers());

            std::this_thread::sleep_for(milliseconds(40));
            control->pause();
            std::this_thread::sleep_for(milliseconds(300));
            assert(pool->alive_count() == 2);
            control->resume();

            auto values = collect_integers(*r, 20, milliseconds(5000));
            assert(values.size() == 20);
            for (size_t i = 0; i < values.size(); ++i) {
                assert(values[i] == static_cast<int64_t>(2 * (i + 1)));
            }
            assert(!r->get(true, milliseconds(200)));

            pool->request_exit_all();
            q->drain();
            r->drain();
            assert(pool->join_all(milliseconds(2000)).all_clean());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 6
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 6: Hung replica detection... ";
        try {
            Logger::set_level(LogLevel::ERROR);
            auto control = ControlSignal::create();
            assert(control);

            auto stubborn = [](const StaticArgs&, const ChannelList&, const ChannelList&,
                               ControlSignal&) {
                while (true) {
                    std::this_thread::sleep_for(milliseconds(50));
                }
            };

            WorkerSpecPtr good, bad;
            assert(WorkerSpecification::create("good", idle_body, 1, {}, {}, {}, control, good));
            assert(WorkerSpecification::create("stubborn", stubborn, 1, {}, {}, {}, control, bad));
            std::unique_ptr<WorkerPool> pool;
            assert(WorkerPool::create({good, bad}, pool));
            assert(pool->start_workers());
            std::this_thread::sleep_for(milliseconds(100));

            auto start = std::chrono::steady_clock::now();
            pool->request_exit_all();
            JoinReport report = pool->join_all(milliseconds(300));
            long waited = elapsed_ms(start);

            assert(!report.all_clean());
            assert(report.replicas[0].outcome == ReplicaOutcome::CLEAN_EXIT);
            assert(report.replicas[1].outcome == ReplicaOutcome::HUNG);
            assert(report.replicas[1].worker_name == "stubborn");
            assert(report.failures().size() == 1);
            assert(waited < 3000);
            assert(pool->alive_count() == 0);
            Logger::set_level(LogLevel::WARNING);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 7
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 7: Failed replicas reported... ";
        try {
            Logger::set_level(LogLevel::ERROR);
            auto control = ControlSignal::create();
            assert(control);

            auto early = [](const StaticArgs&, const ChannelList&, const ChannelList&,
                            ControlSignal&) {};
            auto throwing = [](const StaticArgs&, const ChannelList&, const ChannelList&,
                               ControlSignal&) {
                throw std::runtime_error("sensor unavailable");
            };
            auto crashing = [](const StaticArgs&, const ChannelList&, const ChannelList&,
                               ControlSignal&) {
                raise(SIGKILL);
            };

            WorkerSpecPtr a, b, c;
            assert(WorkerSpecification::create("early", early, 1, {}, {}, {}, control, a));
            assert(WorkerSpecification::create("throwing", throwing, 1, {}, {}, {}, control, b));
            assert(WorkerSpecification::create("crashing", crashing, 1, {}, {}, {}, control, c));
            std::unique_ptr<WorkerPool> pool;
            assert(WorkerPool::create({a, b, c}, pool));
            assert(pool->start_workers());

            // All three end on their own; alive_count() notices without an exit request.
            auto start = std::chrono::steady_clock::now();
            while (pool->alive_count() > 0 && elapsed_ms(start) < 3000) {
                std::this_thread::sleep_for(milliseconds(20));
            }
            assert(pool->alive_count() == 0);

            pool->request_exit_all();
            JoinReport report = pool->join_all(milliseconds(1000));
            assert(report.replicas.size() == 3);
            assert(report.replicas[0].outcome == ReplicaOutcome::EXITED_BEFORE_REQUEST);
            assert(report.replicas[1].outcome == ReplicaOutcome::BODY_FAILED);
            assert(report.replicas[1].detail == kReplicaExitBodyFailed);
            assert(report.replicas[2].outcome == ReplicaOutcome::CRASHED);
            assert(report.replicas[2].detail == SIGKILL);
            assert(report.failures().size() == 3);
            Logger::set_level(LogLevel::WARNING);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 8
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 8: Distinct replica processes... ";
        try {
            auto control = ControlSignal::create();
            auto out = BoundedChannel::create(10);
            assert(control && out);

            auto report_pid = [](const StaticArgs&, const ChannelList&, const ChannelList& outputs,
                                 ControlSignal& control) {
                put_until_exit(*outputs.at(0), IntegerMessage(getpid()), control);
                while (!control.is_exit_requested()) {
                    control.check_pause();
                    std::this_thread::sleep_for(milliseconds(10));
                }
            };

            WorkerSpecPtr spec;
            assert(WorkerSpecification::create("reporter", report_pid, 3, {}, {}, {out},
                                               control, spec));
            std::unique_ptr<WorkerPool> pool;
            assert(WorkerPool::create({spec}, pool));
            assert(pool->start_workers());

            auto pids = collect_integers(*out, 3, milliseconds(5000));
            assert(pids.size() == 3);
            std::set<int64_t> unique(pids.begin(), pids.end());
            assert(unique.size() == 3);
            assert(unique.count(getpid()) == 0);

            pool->request_exit_all();
            JoinReport report = pool->join_all(milliseconds(2000));
            assert(report.all_clean());
            for (int i = 0; i < 3; ++i) {
                assert(report.replicas[i].replica_index == i);
                assert(unique.count(report.replicas[i].pid) == 1);
            }

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 9
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 9: Double start... ";
        try {
            Logger::set_level(LogLevel::ERROR);
            auto control = ControlSignal::create();
            assert(control);
            WorkerSpecPtr spec;
            assert(WorkerSpecification::create("idle", idle_body, 1, {}, {}, {}, control, spec));
            std::unique_ptr<WorkerPool> pool;
            assert(WorkerPool::create({spec}, pool));

            assert(pool->start_workers());
            assert(!pool->start_workers());
            assert(pool->replica_count() == 1);

            pool->request_exit_all();
            assert(pool->join_all(milliseconds(2000)).all_clean());
            Logger::set_level(LogLevel::WARNING);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 10
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 10: Reset refused while running... ";
        try {
            Logger::set_level(LogLevel::ERROR);
            auto control = ControlSignal::create();
            assert(control);
            WorkerSpecPtr spec;
            assert(WorkerSpecification::create("idle", idle_body, 1, {}, {}, {}, control, spec));
            std::unique_ptr<WorkerPool> pool;
            assert(WorkerPool::create({spec}, pool));
            assert(pool->start_workers());

            control->pause();
            assert(!pool->reset_controls());
            assert(control->is_paused());

            pool->request_exit_all();
            assert(pool->join_all(milliseconds(2000)).all_clean());
            assert(pool->reset_controls());
            assert(!control->is_paused());
            assert(!control->is_exit_requested());
            Logger::set_level(LogLevel::WARNING);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 11
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 11: Oversized message dropped... ";
        try {
            const std::string path = "/tmp/test_worker_pool_" + std::to_string(getpid()) + ".log";
            auto control = ControlSignal::create();
            auto tiny = BoundedChannel::create(10, 16);
            assert(control && tiny);

            // 21-byte IntegerMessage + 4-byte frame header > 16-byte arena.
            IntegerMessage message(7);
            assert(!tiny->fits(message.serialize().size()));
            assert(tiny->fits(12));

            Logger::set_level(LogLevel::ERROR);
            assert(Logger::set_log_file(path, true));
            auto start = std::chrono::steady_clock::now();
            bool accepted = put_until_exit(*tiny, message, *control);
            long waited = elapsed_ms(start);
            assert(Logger::set_log_file(""));
            Logger::set_level(LogLevel::WARNING);

            assert(!accepted);
            assert(waited < 100);
            assert(!control->is_exit_requested());
            assert(tiny->is_empty());

            std::ifstream file(path);
            assert(file.is_open());
            int error_lines = 0;
            std::string line;
            while (std::getline(file, line)) {
                if (line.find("[ERROR]") != std::string::npos) error_lines++;
            }
            assert(error_lines == 1);
            unlink(path.c_str());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 12
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 12: Stages behind a too-small channel... ";
        try {
            Logger::set_level(LogLevel::ERROR);
            auto control = ControlSignal::create();
            auto tiny_numbers = BoundedChannel::create(10, 16);
            auto tiny_status = BoundedChannel::create(10, 16);
            assert(control && tiny_numbers && tiny_status);

            WorkerSpecPtr source, status;
            assert(WorkerSpecification::create("counter_source_worker", counter_source_worker, 1,
                                               {int64_t(1), int64_t(3), milliseconds(0)},
                                               {}, {tiny_numbers}, control, source));
            assert(WorkerSpecification::create("status_worker", status_worker, 1,
                                               {std::string("alive"), milliseconds(50)},
                                               {}, {tiny_status}, control, status));
            std::unique_ptr<WorkerPool> pool;
            assert(WorkerPool::create({source, status}, pool));
            assert(pool->start_workers());

            std::this_thread::sleep_for(milliseconds(300));
            assert(pool->alive_count() == 2);
            assert(tiny_numbers->is_empty());
            assert(tiny_status->is_empty());

            auto start = std::chrono::steady_clock::now();
            pool->request_exit_all();
            JoinReport report = pool->join_all(milliseconds(2000));
            assert(report.all_clean());
            assert(elapsed_ms(start) < 1500);
            Logger::set_level(LogLevel::WARNING);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    //--------------------------------------------------------------------------
    // Test 13
    //--------------------------------------------------------------------------
    {
        std::cout << "Test 13: Setup failure with exit already requested... ";
        try {
            Logger::set_level(LogLevel::ERROR);
            auto control = ControlSignal::create();
            auto out = BoundedChannel::create(4);
            assert(control && out);

            // Exit lands between the failed setup and the body's return.
            auto failing_setup = [](const StaticArgs&, const ChannelList&, const ChannelList&,
                                    ControlSignal& control) {
                control.request_exit();
                report_setup_failure("camera not found");
            };

            WorkerSpecPtr a, b;
            assert(WorkerSpecification::create("failing_setup", failing_setup, 1, {}, {}, {},
                                               control, a));
            // Miswired stage: scale_worker needs one input.
            assert(WorkerSpecification::create("scale_worker", scale_worker, 1, {int64_t(2)},
                                               {}, {out}, control, b));
            std::unique_ptr<WorkerPool> pool;
            assert(WorkerPool::create({a, b}, pool));
            assert(pool->start_workers());

            JoinReport report = pool->join_all(milliseconds(2000));
            assert(control->is_exit_requested());
            assert(report.replicas.size() == 2);
            assert(report.replicas[0].outcome == ReplicaOutcome::EXITED_BEFORE_REQUEST);
            assert(report.replicas[1].outcome == ReplicaOutcome::EXITED_BEFORE_REQUEST);
            assert(!report.all_clean());
            Logger::set_level(LogLevel::WARNING);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return failed > 0 ? 1 : 0;
}

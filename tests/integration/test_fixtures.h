/**
 * @file test_fixtures.h
 * @brief Test fixtures for process and dispatcher tests
 */

#ifndef CLOUDXFER_TEST_FIXTURES_H
#define CLOUDXFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <cloudxfer/cloudxfer.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace cloudxfer::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("cloudxfer_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    /**
     * @brief Write an executable shell script standing in for the transfer tool
     * @param name File name inside the test directory
     * @param body Script body, run by /bin/sh
     */
    auto create_tool_script(const std::string& name, const std::string& body)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        {
            std::ofstream file(path);
            file << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_all |
                                         std::filesystem::perms::group_read |
                                         std::filesystem::perms::group_exec,
                                     std::filesystem::perm_options::replace);
        return path;
    }

    /**
     * @brief Tool that reports progress in the usual dialect and succeeds
     */
    auto create_progress_tool(const std::string& name = "fake-tool")
        -> std::filesystem::path {
        return create_tool_script(name,
                                  "echo 'Progress: 50.000%, Speed: 1.00 KiB/s'\n"
                                  "echo 'some diagnostic line' >&2\n"
                                  "echo 'Progress: 100.000%'\n"
                                  "exit 0");
    }

    /**
     * @brief Tool that prints to stderr and exits with the given status
     */
    auto create_failing_tool(const std::string& message, int status,
                             const std::string& name = "failing-tool")
        -> std::filesystem::path {
        return create_tool_script(name,
                                  "echo '" + message + "' >&2\n"
                                  "exit " + std::to_string(status));
    }

    /**
     * @brief Tool that reports progress, sleeps, then succeeds
     */
    auto create_sleeping_tool(double seconds, const std::string& name = "sleeping-tool")
        -> std::filesystem::path {
        return create_tool_script(name,
                                  "echo 'Progress: 10%'\n"
                                  "sleep " + std::to_string(seconds) + "\n"
                                  "echo 'Progress: 100%'\n"
                                  "exit 0");
    }

    std::filesystem::path test_dir_;
    std::filesystem::path download_dir_;
};

/**
 * @brief Event sink collecting snapshots per transfer id
 */
class collecting_sink : public event_sink {
public:
    auto on_transfer_update(const transfer_update& update) -> void override {
        {
            std::lock_guard lock(mutex_);
            by_id_[update.id].push_back(update);
            all_.push_back(update);
        }
        cv_.notify_all();
    }

    /**
     * @brief Wait until the transfer published a terminal snapshot
     * @return true if it did before the timeout
     */
    auto wait_for_terminal(const std::string& id,
                           std::chrono::milliseconds timeout = std::chrono::seconds(10))
        -> bool {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            auto it = by_id_.find(id);
            return it != by_id_.end() && !it->second.empty() &&
                   is_terminal_status(it->second.back().status);
        });
    }

    auto updates_for(const std::string& id) const -> std::vector<transfer_update> {
        std::lock_guard lock(mutex_);
        auto it = by_id_.find(id);
        return it == by_id_.end() ? std::vector<transfer_update>{} : it->second;
    }

    auto all_updates() const -> std::vector<transfer_update> {
        std::lock_guard lock(mutex_);
        return all_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::vector<transfer_update>> by_id_;
    std::vector<transfer_update> all_;
};

/**
 * @brief Test fixture owning a dispatcher wired to a collecting sink
 */
class DispatcherFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        sink_ = std::make_shared<collecting_sink>();
        profile_.access_key_id = "AKID";
        profile_.access_key_secret = "secret";
        profile_.region = "oss-cn-hangzhou";
    }

    void TearDown() override {
        if (dispatcher_) {
            dispatcher_->wait_idle();
        }
        dispatcher_.reset();
        TempDirectoryFixture::TearDown();
    }

    auto make_dispatcher(const std::string& tool_path,
                         const std::string& fallback_path,
                         std::size_t max_concurrent = 1) -> transfer_dispatcher& {
        auto built = transfer_dispatcher::builder()
                         .with_tool_path(tool_path)
                         .with_fallback_tool_path(fallback_path)
                         .with_max_concurrent(max_concurrent)
                         .with_emit_interval(std::chrono::milliseconds(0))
                         .with_profile(profile_)
                         .with_event_sink(sink_)
                         .build();
        EXPECT_TRUE(built.has_value()) << "Failed to create dispatcher";
        dispatcher_ = std::make_unique<transfer_dispatcher>(std::move(built.value()));
        return *dispatcher_;
    }

    std::shared_ptr<collecting_sink> sink_;
    storage_profile profile_;
    std::unique_ptr<transfer_dispatcher> dispatcher_;
};

}  // namespace cloudxfer::test

#endif  // CLOUDXFER_TEST_FIXTURES_H

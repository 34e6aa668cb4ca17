#pragma once

#include "fs/LocalDriver.hpp"
#include "storage/Engine.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace stash::test {

// LocalDriver with switchable failures.
class FlakyDriver : public fs::LocalDriver {
public:
    bool failCreateDirectory = false;
    bool failAttributes = false;
    bool failWrite = false;
    bool failRead = false;
    bool failRemove = false;

    void createDirectory(const std::filesystem::path& path) override {
        if (failCreateDirectory)
            throw std::filesystem::filesystem_error("injected", path, std::make_error_code(std::errc::permission_denied));
        LocalDriver::createDirectory(path);
    }

    void setAttributes(const std::filesystem::path& path, const fs::Attributes& attrs) override {
        if (failAttributes)
            throw std::filesystem::filesystem_error("injected", path, std::make_error_code(std::errc::operation_not_permitted));
        LocalDriver::setAttributes(path, attrs);
    }

    [[nodiscard]] bool writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) override {
        if (failWrite) return false;
        return LocalDriver::writeFile(path, bytes);
    }

    [[nodiscard]] std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path& path) const override {
        if (failRead) throw std::runtime_error("injected read failure: " + path.string());
        return LocalDriver::readFile(path);
    }

    void removeDirectory(const std::filesystem::path& path) override {
        if (failRemove)
            throw std::filesystem::filesystem_error("injected", path, std::make_error_code(std::errc::device_or_resource_busy));
        LocalDriver::removeDirectory(path);
    }
};

// Per-test scratch root under the system temp directory.
class StorageTest : public ::testing::Test {
protected:
    std::filesystem::path root;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = std::filesystem::temp_directory_path() /
               (std::string("stash_test_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    [[nodiscard]] storage::Options options(const std::string& folder = "Default") const {
        storage::Options o;
        o.rootOverride = root;
        o.folder = folder;
        return o;
    }

    static void writeRaw(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }
};

inline void expectError(const std::function<void()>& fn, const storage::ErrorCode code) {
    try {
        fn();
        ADD_FAILURE() << "expected storage::Error(" << storage::to_string(code) << ")";
    } catch (const storage::Error& e) {
        EXPECT_EQ(e.code(), code) << e.what();
    }
}

}

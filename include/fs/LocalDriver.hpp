#pragma once

#include "fs/Driver.hpp"

namespace stash::fs {

class LocalDriver : public Driver {
public:
    [[nodiscard]] bool exists(const std::filesystem::path& path) const override;
    void createDirectory(const std::filesystem::path& path) override;
    void setAttributes(const std::filesystem::path& path, const Attributes& attrs) override;
    [[nodiscard]] bool writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) override;
    [[nodiscard]] std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path& path) const override;
    void removeFile(const std::filesystem::path& path) override;
    void removeDirectory(const std::filesystem::path& path) override;
};

}

#pragma once

#include "attest/crypto.hpp"
#include <filesystem>
#include <string>

namespace attest::testing
{
    /** Unique directory under the system temp dir, removed on destruction */
    class TempDir
    {
    public:
        explicit TempDir(const std::string &prefix = "attest-test")
            : path_(std::filesystem::temp_directory_path() / (prefix + "-" + crypto::SecureRandom::uuid_v4()))
        {
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }
        std::string str(const std::string &child = "") const
        {
            return child.empty() ? path_.string() : (path_ / child).string();
        }

    private:
        std::filesystem::path path_;
    };

    inline crypto::Bytes bytes_of(const std::string &s)
    {
        return crypto::Bytes(s.begin(), s.end());
    }
} // namespace attest::testing

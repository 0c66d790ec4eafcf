#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace StatTrack
{
    namespace Testing
    {
        /// Scratch directory removed with everything in it on destruction.
        class TempDir
        {
        public:
            TempDir()
            {
                static std::atomic<unsigned> counter{0};
                std::random_device rd;
                const std::string name = "stattrack-test-" + std::to_string(::getpid()) + "-" +
                                         std::to_string(counter++) + "-" + std::to_string(rd());
                m_path = std::filesystem::temp_directory_path() / name;
                std::filesystem::create_directories(m_path);
            }

            TempDir(const TempDir &)            = delete;
            TempDir &operator=(const TempDir &) = delete;

            ~TempDir()
            {
                std::error_code ec;
                std::filesystem::remove_all(m_path, ec);
            }

            const std::filesystem::path &path() const noexcept { return m_path; }

            std::string file(std::string_view name) const
            {
                return (m_path / std::string(name)).string();
            }

        private:
            std::filesystem::path m_path;
        };

        inline void writeFile(const std::string &path, std::string_view content)
        {
            std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
        }

        inline void appendFile(const std::string &path, std::string_view content)
        {
            std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::app);
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
        }

        inline std::string readFile(const std::string &path)
        {
            std::ifstream in(path, std::ios::in | std::ios::binary);
            return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        /// Poll a predicate until it holds or the timeout expires.
        template <typename Pred>
        bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
        {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline)
            {
                if (pred())
                {
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            return pred();
        }

    } // namespace Testing
} // namespace StatTrack

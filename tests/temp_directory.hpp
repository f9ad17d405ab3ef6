#ifndef TEMP_DIRECTORY_HPP
#define TEMP_DIRECTORY_HPP

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>

// Creates a fresh directory under the system temporary directory and removes
// it with everything inside on destruction
class TempDirectory
{
public:
    TempDirectory()
    {
        std::random_device rd;
        do
        {
            m_path = std::filesystem::temp_directory_path() /
                     ("perceptron_test_" + std::to_string(rd()));
        } while (!std::filesystem::create_directory(m_path));
    }

    TempDirectory(const TempDirectory &) = delete;
    TempDirectory &operator=(const TempDirectory &) = delete;

    ~TempDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
    }

    [[nodiscard]] const std::filesystem::path &path() const noexcept
    {
        return m_path;
    }

    std::filesystem::path write_file(const std::string &name,
                                     std::string_view content) const
    {
        const auto file_path = m_path / name;
        std::ofstream file(file_path);
        file << content;
        return file_path;
    }

private:
    std::filesystem::path m_path;
};

#endif // TEMP_DIRECTORY_HPP

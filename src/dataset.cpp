#include "dataset.hpp"
#include "errors.hpp"

#include <charconv>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{

[[nodiscard]] std::string_view trim(std::string_view text)
{
    constexpr std::string_view whitespace {" \t\r"};
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<float> parse_line(std::string_view line,
                                            std::size_t line_number)
{
    std::vector<float> values;
    while (true)
    {
        const auto comma = line.find(',');
        const auto cell = trim(line.substr(0, comma));

        float value {};
        const auto *const end = cell.data() + cell.size();
        const auto [ptr, ec] = std::from_chars(cell.data(), end, value);
        if (cell.empty() || ec != std::errc {} || ptr != end)
        {
            throw FormatError("Line " + std::to_string(line_number) +
                              ": invalid number \"" + std::string(cell) +
                              '\"');
        }
        values.push_back(value);

        if (comma == std::string_view::npos)
        {
            return values;
        }
        line.remove_prefix(comma + 1);
    }
}

} // namespace

std::vector<Example>
load_csv(const std::filesystem::path &path, int input_size, int target_size)
{
    if (input_size <= 0 || target_size < 0)
    {
        throw std::invalid_argument("Invalid CSV layout of " +
                                    std::to_string(input_size) + " inputs and " +
                                    std::to_string(target_size) + " targets");
    }

    std::ifstream file(path);
    if (!file)
    {
        std::ostringstream message;
        message << "Failed to open " << std::quoted(path.string());
        throw IoError(message.str());
    }

    const auto columns = static_cast<std::size_t>(input_size + target_size);
    std::vector<Example> examples;
    std::string line;
    std::size_t line_number {0};
    while (std::getline(file, line))
    {
        ++line_number;
        const auto content = trim(line);
        if (content.empty() || content.front() == '#')
        {
            continue;
        }

        const auto values = parse_line(content, line_number);
        if (values.size() != columns)
        {
            throw FormatError("Line " + std::to_string(line_number) + ": " +
                              std::to_string(values.size()) +
                              " values, expected " + std::to_string(columns));
        }

        Example example {.input = Eigen::VectorXf(input_size),
                         .target = Eigen::VectorXf(target_size)};
        for (int i {0}; i < input_size; ++i)
        {
            example.input(i) = values[static_cast<std::size_t>(i)];
        }
        for (int i {0}; i < target_size; ++i)
        {
            example.target(i) =
                values[static_cast<std::size_t>(input_size + i)];
        }
        examples.push_back(std::move(example));
    }
    if (file.bad())
    {
        throw IoError("Failed while reading " + path.string());
    }

    return examples;
}

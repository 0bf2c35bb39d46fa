#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>

// rejected input, raised before any search starts
class validation_error : public std::runtime_error {
    public:
        validation_error(const std::string& msg) : std::runtime_error{msg}, problems{msg} {}
        validation_error(const std::vector<std::string>& problems) :
            std::runtime_error{fmt::format("{} validation problem(s): {}", problems.size(), fmt::join(problems, "; "))},
            problems{problems} {
        }

        const std::vector<std::string>& get_problems() const { return problems; }

    private:
        std::vector<std::string> problems;
};

// a defect inside the engine, never caused by user input
class solver_fault : public std::runtime_error {
    public:
        solver_fault(const std::string& msg) : std::runtime_error{msg} {}
};

// a file the CLI reads from or writes to is unusable
class io_error : public std::runtime_error {
    public:
        io_error(const std::string& msg) : std::runtime_error{msg} {}
};

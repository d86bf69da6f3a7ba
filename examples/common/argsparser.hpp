/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPLIVE_EXAMPLES_ARGSPARSER_HPP
#define CPPLIVE_EXAMPLES_ARGSPARSER_HPP

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

//------------------------------------------------------------------------------
// Positional command line arguments, each having a name and a default.
//------------------------------------------------------------------------------
class ArgsParser
{
public:
    struct Entry
    {
        std::string name;
        std::string value;
    };

    using EntryList = std::vector<Entry>;

    explicit ArgsParser(EntryList entries) : entries_(std::move(entries)) {}

    // Returns false if help was requested instead.
    template <typename... Ts>
    bool parse(int argc, char* argv[], Ts&... args)
    {
        if (argc >= 2 && std::string{argv[1]} == "help")
        {
            showHelp(argv[0]);
            return false;
        }

        for (int i = 1; i < argc && i <= static_cast<int>(entries_.size()); ++i)
            entries_[i - 1].value = argv[i];

        assign(0, args...);
        return true;
    }

private:
    void assign(unsigned) {}

    template <typename T, typename... Tail>
    void assign(unsigned index, T& arg, Tail&... tail)
    {
        const auto& entry = entries_.at(index);
        std::istringstream iss{entry.value};
        iss >> arg;
        if (!iss)
            throw std::runtime_error("Invalid " + entry.name + " argument");
        assign(index + 1, tail...);
    }

    void showHelp(const char* cmd) const
    {
        std::cout << "Usage: " << cmd;
        for (const auto& entry: entries_)
            std::cout << " [" << entry.name;
        std::cout << std::string(entries_.size(), ']') << "\nDefaults:";
        for (const auto& entry: entries_)
            std::cout << ' ' << entry.name << '=' << entry.value;
        std::cout << "\n";
    }

    EntryList entries_;
};

#endif // CPPLIVE_EXAMPLES_ARGSPARSER_HPP

/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libirr_CLIArguments_hpp
#define libirr_CLIArguments_hpp

#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

namespace libirr {

/**
 * Sequence of command line tokens.
 *
 * Besides iteration over the tokens, it exposes a null-terminated
 * argc/argv view so the tokens can be handed to boost::program_options.
 */
class CLIArguments {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

public:
    CLIArguments() = default;
    CLIArguments(int argc, char* argv[]);
    CLIArguments(std::initializer_list<std::string> args);
    CLIArguments(const_iterator begin, const_iterator end);

    void push_back(const std::string& arg);

    int argc() const;
    char** argv() const;

    const_iterator begin() const;
    const_iterator end() const;

    CLIArguments& operator+=(const CLIArguments& rhs);

    bool empty() const;
    void clear();
    std::string string() const;

private:
    std::vector<std::string> args;
    mutable std::vector<char*> pointers;
};

bool operator==(const CLIArguments&, const CLIArguments&);
const CLIArguments operator+(const CLIArguments&, const CLIArguments&);
std::ostream& operator<<(std::ostream&, const CLIArguments&);

}

#endif

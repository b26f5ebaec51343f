/*
 * IRR
 *
 * Copyright (c) 2024-2026, The IRR Authors. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <algorithm>

#include <boost/algorithm/string/join.hpp>


namespace libirr {

CLIArguments::CLIArguments(int argc, char* argv[]) {
    for(int i=0; i<argc; ++i) {
        push_back(argv[i]);
    }
}

CLIArguments::CLIArguments(std::initializer_list<std::string> args)
    : args{args}
{}

CLIArguments::CLIArguments(const_iterator begin, const_iterator end)
    : args{begin, end}
{}

void CLIArguments::push_back(const std::string& arg) {
    args.push_back(arg);
}

int CLIArguments::argc() const {
    return static_cast<int>(args.size());
}

// The returned array is valid until the next modification of the arguments
char** CLIArguments::argv() const {
    pointers.clear();
    pointers.reserve(args.size() + 1);
    for(const auto& arg : args) {
        pointers.push_back(const_cast<char*>(arg.c_str()));
    }
    pointers.push_back(nullptr);
    return pointers.data();
}

CLIArguments::const_iterator CLIArguments::begin() const {
    return args.cbegin();
}

CLIArguments::const_iterator CLIArguments::end() const {
    return args.cend();
}

CLIArguments& CLIArguments::operator+=(const CLIArguments& rhs) {
    args.insert(args.end(), rhs.begin(), rhs.end());
    return *this;
}

bool CLIArguments::empty() const {
    return args.empty();
}

void CLIArguments::clear() {
    args.clear();
    pointers.clear();
}

std::string CLIArguments::string() const {
    return boost::algorithm::join(args, " ");
}

bool operator==(const CLIArguments& lhs, const CLIArguments& rhs) {
    return lhs.argc() == rhs.argc()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin());
}

const CLIArguments operator+(const CLIArguments& lhs, const CLIArguments& rhs) {
    auto result = lhs;
    result += rhs;
    return result;
}

std::ostream& operator<<(std::ostream& os, const CLIArguments& args) {
    os << "[";
    bool isFirstArg = true;
    for(const auto& arg : args) {
        if(!isFirstArg) {
            os << ", ";
        }
        else {
            isFirstArg = false;
        }
        os << "\"" << arg << "\"";
    }
    os << "]";
    return os;
}

}

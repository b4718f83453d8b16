#pragma once

#include <string>
#include <core/types.hpp>
#include <core/secret.hpp>

// Read a secret from fd. With line_only, stop after the first newline
// (interactive input); otherwise read to EOF. One trailing newline is
// dropped either way.
Result<Secret> read_secret_fd(int fd, bool line_only);

// Read the launch secret from stdin: prompt on stderr with echo off when
// stdin is a terminal, otherwise read stdin to EOF.
Result<Secret> read_secret_stdin(const std::string& prompt);

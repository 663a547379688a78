#pragma once

#include <gtest/gtest.h>

/*
 * main() of every test binary. gtest consumes its own --gtest_* flags; what remains is parsed as
 * util::Logging options. --help prints both sets.
 */
int launch_gtest(int argc, char** argv);

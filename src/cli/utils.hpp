//! # CLI Utilities Interface
//!
//! | Function              | Description                              |
//! |-----------------------|------------------------------------------|
//! | `take_option_value()` | Reads `--flag VALUE` or `--flag=VALUE`   |
//! | `print_usage()`       | Print CLI help text                      |
//! | `print_version()`     | Print version                            |

#pragma once
#include <string>
#include <string_view>

namespace twbuild::cli {

/// Matches `argv[i]` against `flag`. Accepts `--flag=VALUE` or `--flag VALUE`,
/// advancing `i` past a separate value. Returns false when `argv[i]` is not
/// `flag`; sets `missing` when the flag has no value.
bool take_option_value(int argc, char* argv[], int& i, std::string_view flag, std::string& value,
                       bool& missing);

// Help text
void print_usage();
void print_version();

} // namespace twbuild::cli

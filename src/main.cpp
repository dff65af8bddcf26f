//! # twbuild Entry Point
//!
//! Delegates to the CLI driver.
//!
//! ```bash
//! OUT_DIR=build/tw PROFILE=release twbuild build --css assets/app.css
//! twbuild render --target jit
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return twbuild_main(argc, argv);
}

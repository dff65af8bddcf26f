//! # CLI Driver Interface
//!
//! `twbuild_main()` dispatches to the command handler named by argv[1].

#pragma once

int twbuild_main(int argc, char* argv[]);

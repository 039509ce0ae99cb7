//! # CLI Driver Interface
//!
//! `argschema_main()` dispatches to the command handler named by argv[1].

#pragma once

// Main driver entry point
int argschema_main(int argc, char* argv[]);

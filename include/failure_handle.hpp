/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

// Print a backtrace to stderr on SIGSEGV, SIGABRT, SIGFPE, SIGILL and SIGBUS,
// then die with the same signal.
void InitFailureHandle();

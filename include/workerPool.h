#ifndef MUDUOSTATIC_WORKERPOOL_H
#define MUDUOSTATIC_WORKERPOOL_H

#include <signal.h>
#include <sys/types.h>

#include <vector>

// Forks `count - 1` children. Returns the worker index the calling process
// runs as: 0 in the parent, 1..count-1 in a child. Pending stdio output is
// flushed first so children do not repeat it. A failed fork is logged and
// the parent carries on with the workers it already has.
int fork_workers(int count, std::vector<pid_t>* children);

// sends `sig` to every child and reaps them all
void stop_workers(const std::vector<pid_t>& children, int sig = SIGTERM);

#endif  // MUDUOSTATIC_WORKERPOOL_H

#include "ProcessWorker.h"

#include <cerrno>
#include <csignal>
#include <sys/wait.h>

ProcessWorker::ProcessWorker(pid_t pid)
    : processId(pid) {
}

bool ProcessWorker::isAlive() const {
    if (processId <= 0)
        return false;

    // reap it if it happens to be our child, otherwise a zombie looks alive
    int status = 0;
    if (waitpid(processId, &status, WNOHANG) == processId)
        return false;

    if (kill(processId, 0) == 0)
        return true;

    // exists but belongs to someone else
    return errno == EPERM;
}

void ProcessWorker::cancel() {
    if (processId > 0)
        kill(processId, SIGTERM);
}

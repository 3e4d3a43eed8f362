#pragma once
#include <sys/types.h>

#include "Worker.h"

// An external download process identified by its PID
class ProcessWorker : public Worker {
public:
    explicit ProcessWorker(pid_t pid);

    bool isAlive() const override;
    void cancel() override;

    pid_t pid() const { return processId; }

private:
    pid_t processId;
};

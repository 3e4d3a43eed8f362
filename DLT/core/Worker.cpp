#include "Worker.h"
#include "../io/ProgressLog.h"

std::string ModelWorker::currentProgressLog() const {
    return progressLog().str();
}

#include "LogProtocolReader.h"
#include "../core/Worker.h"

#include <cctype>
#include <stdexcept>

namespace {
const std::string START_STR = ModelWorker::START_MARKER;
const std::string FILE_SIZE_STR = ModelWorker::FILE_SIZE_MARKER;
const std::string END_STR = ModelWorker::END_MARKER;
const std::string FINISH_STR = ModelWorker::FINISH_MARKER;
const std::string ERROR_STR = ModelWorker::ERROR_MARKER;

std::string trim(const std::string& s) {
    std::size_t first = 0;
    while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first])))
        ++first;

    std::size_t last = s.size();
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1])))
        --last;

    return s.substr(first, last - first);
}

// A size field that is still being appended ("10" of "1000") is only
// trusted once whitespace follows it.
std::optional<std::uint64_t> parseSize(const std::string& field, bool complete) {
    std::size_t i = 0;
    while (i < field.size() && std::isspace(static_cast<unsigned char>(field[i])))
        ++i;

    std::size_t digitsBegin = i;
    while (i < field.size() && std::isdigit(static_cast<unsigned char>(field[i])))
        ++i;

    if (i == digitsBegin)
        return std::nullopt;

    if (!complete && i == field.size())
        return std::nullopt;

    if (complete && !trim(field.substr(i)).empty())
        return std::nullopt;

    try {
        return static_cast<std::uint64_t>(std::stoull(field.substr(digitsBegin, i - digitsBegin)));
    }
    catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
}

LogProtocolReader::LogProtocolReader(const ProgressLog& l)
    : log(l) {
}

std::vector<LogRecord> LogProtocolReader::poll() {
    std::vector<LogRecord> out;
    if (finishSeen)
        return out;

    const std::string text = log.readFrom(offset);
    offset += consume(text, out);
    return out;
}

std::size_t LogProtocolReader::consume(const std::string& text, std::vector<LogRecord>& out) {
    std::size_t pos = 0;

    for (;;) {
        if (open) {
            const std::size_t endInd = text.find(END_STR, pos);

            if (open->failed) {
                // failure already reported, drop everything up to its END
                if (endInd == std::string::npos)
                    break;
                pos = endInd + END_STR.size();
                open.reset();
                continue;
            }

            const std::size_t errInd = text.find(ERROR_STR, pos);
            if (errInd != std::string::npos && (endInd == std::string::npos || errInd < endInd)) {
                out.push_back({ open->path, std::nullopt, LogRecord::State::Failed });
                if (endInd == std::string::npos) {
                    open->failed = true;
                    pos = errInd + ERROR_STR.size();
                    break;
                }
                pos = endInd + END_STR.size();
                open.reset();
                continue;
            }

            if (endInd == std::string::npos) {
                out.push_back({ open->path, parseSize(text.substr(pos), false), LogRecord::State::InProgress });
                break;
            }

            auto declared = parseSize(text.substr(pos, endInd - pos), true);
            out.push_back({ open->path, declared,
                declared ? LogRecord::State::Complete : LogRecord::State::Failed });
            pos = endInd + END_STR.size();
            open.reset();
            continue;
        }

        if (pos >= text.size())
            break;

        const std::size_t startInd = text.find(START_STR, pos);
        const std::size_t finishInd = text.find(FINISH_STR, pos);

        if (finishInd != std::string::npos && (startInd == std::string::npos || finishInd < startInd)) {
            finishSeen = true;
            pos = finishInd + FINISH_STR.size();
            break;
        }

        if (startInd == std::string::npos) {
            // tail of a record that started before we could see it
            const std::size_t endInd = text.find(END_STR, pos);
            if (endInd == std::string::npos)
                break;
            pos = endInd + END_STR.size();
            continue;
        }

        const std::size_t sizeInd = text.find(FILE_SIZE_STR, startInd + START_STR.size());
        if (sizeInd == std::string::npos) {
            // path still being written
            pos = startInd;
            break;
        }

        open = OpenRecord{
            trim(text.substr(startInd + START_STR.size(), sizeInd - startInd - START_STR.size())),
            false
        };
        pos = sizeInd + FILE_SIZE_STR.size();
    }

    return pos;
}

#pragma once

#include <string>
#include "../errors/errors.hpp"
#include "../models/models.hpp"

namespace processor
{
    struct ProcessOutcome
    {
        bool success = false;
        errors::ErrorKind kind = errors::ErrorKind::None;
        std::string err;

        static ProcessOutcome ok() { return {true, errors::ErrorKind::None, ""}; }
        static ProcessOutcome failure(errors::ErrorKind kind, const std::string &err) { return {false, kind, err}; }
    };

    // Scarce, non-reentrant engine (e.g. transcription) run once per queue item.
    class CaptureProcessor
    {
    public:
        virtual ~CaptureProcessor() = default;
        virtual ProcessOutcome process(const models::QueueItem &item) = 0;
    };

    // Runs "<command> '<sourcePath>'" through the shell.
    // Exit 0 is success, exit 2 means the input is unusable, anything else
    // is assumed to be a transient engine failure.
    class CommandProcessor : public CaptureProcessor
    {
    public:
        explicit CommandProcessor(const std::string &command);
        ProcessOutcome process(const models::QueueItem &item) override;

        static std::string shellQuote(const std::string &arg);

    private:
        std::string command_;
    };
} // namespace processor

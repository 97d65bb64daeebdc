#include "capture_processor.hpp"
#include "../fsUtils/fsUtils.hpp"
#include "../logger/Mylogger.hpp"
#include <cstdlib>
#include <sys/wait.h>

namespace processor
{
    CommandProcessor::CommandProcessor(const std::string &command)
        : command_(command) {}

    std::string CommandProcessor::shellQuote(const std::string &arg)
    {
        std::string quoted = "'";
        for (char c : arg)
        {
            if (c == '\'')
                quoted += "'\\''";
            else
                quoted += c;
        }
        quoted += "'";
        return quoted;
    }

    ProcessOutcome CommandProcessor::process(const models::QueueItem &item)
    {
        if (command_.empty())
            return ProcessOutcome::failure(errors::ErrorKind::TransientIO, "No processor command configured");
        if (!fsUtils::isUsableFile(item.sourcePath))
            return ProcessOutcome::failure(errors::ErrorKind::PermanentResource,
                                           "Source file missing or empty: " + item.sourcePath);

        const std::string cmd = command_ + " " + shellQuote(item.sourcePath);
        MyLogger::info("Processor >> running: " + cmd);
        int status = std::system(cmd.c_str());
        if (status == -1)
            return ProcessOutcome::failure(errors::ErrorKind::TransientIO, "Failed to spawn processor");
        if (!WIFEXITED(status))
            return ProcessOutcome::failure(errors::ErrorKind::TransientIO, "Processor terminated abnormally");

        int code = WEXITSTATUS(status);
        if (code == 0)
            return ProcessOutcome::ok();
        if (code == 2)
            return ProcessOutcome::failure(errors::ErrorKind::PermanentResource,
                                           "Processor rejected input (exit 2)");
        return ProcessOutcome::failure(errors::ErrorKind::TransientIO,
                                       "Processor exited with " + std::to_string(code));
    }
} // namespace processor

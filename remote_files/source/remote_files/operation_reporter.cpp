#include <remote_files/operation_reporter.hpp>

#include <log/log.hpp>

namespace RemoteFiles
{
    void SpdlogLogSink::message(std::string const& text)
    {
        Log::info("{}", text);
    }
    OperationReporter::OperationReporter(
        StatusIndicator& indicator,
        LogSink& logSink,
        std::optional<std::string> displayName)
        : indicator_{&indicator}
        , logSink_{&logSink}
        , displayName_{std::move(displayName)}
    {
        if (displayName_ && displayName_->empty())
            displayName_ = std::nullopt;
    }
    std::string OperationReporter::decorate(std::string const& message) const
    {
        if (displayName_)
            return *displayName_ + "> " + message;
        return message;
    }
    void OperationReporter::announce(std::string const& message)
    {
        const auto text = decorate(message);
        Log::debug("Operation: {}", text);
        indicator_->announce(text);
        logSink_->message(text);
    }
    void OperationReporter::log(std::string const& message)
    {
        logSink_->message(decorate(message));
    }
    void OperationReporter::settle()
    {
        indicator_->settle();
    }
    OperationScope::OperationScope(OperationReporter& reporter, std::string const& message)
        : reporter_{&reporter}
        , settled_{false}
    {
        reporter_->announce(message);
    }
    OperationScope::~OperationScope()
    {
        settle();
    }
    void OperationScope::settle()
    {
        if (settled_)
            return;
        settled_ = true;
        reporter_->settle();
    }
}

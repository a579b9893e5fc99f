#pragma once

#include <optional>
#include <string>

namespace RemoteFiles
{
    /**
     * @brief The transient "in progress" indicator of the host UI.
     */
    class StatusIndicator
    {
      public:
        virtual ~StatusIndicator() = default;

        virtual void announce(std::string const& text) = 0;

        /**
         * @brief Clears the indicator. Must be a no-op if nothing is shown.
         */
        virtual void settle() = 0;
    };

    class NullStatusIndicator : public StatusIndicator
    {
      public:
        void announce(std::string const&) override
        {}
        void settle() override
        {}
    };

    /**
     * @brief Append only message log of the host.
     */
    class LogSink
    {
      public:
        virtual ~LogSink() = default;
        virtual void message(std::string const& text) = 0;
    };

    /**
     * @brief Writes every message at info level to the process log.
     */
    class SpdlogLogSink : public LogSink
    {
      public:
        void message(std::string const& text) override;
    };

    /**
     * @brief Prefixes messages with the endpoint name and forwards them to the indicator and the log.
     * The indicator is shared by all operations of one endpoint, so concurrent operations overwrite each other.
     */
    class OperationReporter
    {
      public:
        OperationReporter(StatusIndicator& indicator, LogSink& logSink, std::optional<std::string> displayName);

        void announce(std::string const& message);
        void log(std::string const& message);
        void settle();

        std::string decorate(std::string const& message) const;

      private:
        StatusIndicator* indicator_;
        LogSink* logSink_;
        std::optional<std::string> displayName_;
    };

    /**
     * @brief Announces on construction and settles exactly once, at the latest on destruction.
     */
    class OperationScope
    {
      public:
        OperationScope(OperationReporter& reporter, std::string const& message);
        ~OperationScope();
        OperationScope(OperationScope const&) = delete;
        OperationScope& operator=(OperationScope const&) = delete;
        OperationScope(OperationScope&&) = delete;
        OperationScope& operator=(OperationScope&&) = delete;

        void settle();

      private:
        OperationReporter* reporter_;
        bool settled_;
    };
}

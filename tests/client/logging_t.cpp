#include "../../src/client/logging.hxx"
#include <gtest/gtest.h>
#include <iostream>
#include <ledger/logging.hxx>
#include <spdlog/sinks/base_sink.h>

using namespace ledger;

class TrivialFileSink : public spdlog::sinks::base_sink<std::mutex>
{
  protected:
    void sink_it_(const spdlog::details::log_msg& msg) override
    {
        spdlog::memory_buf_t formatted;
        base_sink<std::mutex>::formatter_->format(msg, formatted);
        std::cerr << fmt::to_string(formatted);
    }
    void flush_() override
    {
    }
};

TEST(ClientLoggingTests, LevelsMapToSpdlog)
{
    ASSERT_EQ(spdlog::level::trace, ledger_to_spdlog_level(log_level::TRACE));
    ASSERT_EQ(spdlog::level::warn, ledger_to_spdlog_level(log_level::WARN));
    ASSERT_EQ(spdlog::level::off, ledger_to_spdlog_level(log_level::OFF));
}

TEST(ClientLoggingTests, LogLevelsWork)
{
    std::string log_message = "I am a log";
    auto sink = std::make_shared<TrivialFileSink>();
    create_loggers(log_level::DEBUG, sink);
    set_client_log_level(log_level::INFO);
    testing::internal::CaptureStderr();
    client_log->debug(log_message);
    client_log->flush();
    auto err = testing::internal::GetCapturedStderr();
    ASSERT_TRUE(err.empty()) << "err = " << err;
}

TEST(ClientLoggingTests, CanUseCustomSink)
{
    std::string log_message = "I am a log";
    auto sink = std::make_shared<TrivialFileSink>();
    create_loggers(log_level::DEBUG, sink);
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    client_log->debug(log_message);
    client_log->flush();
    auto out = testing::internal::GetCapturedStdout();
    ASSERT_TRUE(out.empty()) << "out = " << out;
    auto err = testing::internal::GetCapturedStderr();
    ASSERT_NE(std::string::npos, err.find(log_message)) << "err = " << err;
}

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Logging/CLogger.h"
#include "Logging/Logger.h"

using namespace Stevedore::Core::Logging;

namespace {
class CaptureSink : public ILogSink {
public:
    void write(const LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back(entry);
    }
    void flush() override { ++flushes; }

    std::vector<LogEntry> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries;
    }

    int flushes = 0;

private:
    mutable std::mutex _mutex;
    std::vector<LogEntry> _entries;
};

// Swaps the global logger's sinks for a capture sink for the test's duration
class GlobalCapture {
public:
    GlobalCapture() : _previous(Logger::global().minLevel()) {
        sink = std::make_shared<CaptureSink>();
        Logger::global().addSink(sink);
        Logger::global().setMinLevel(LogLevel::Trace);
    }
    ~GlobalCapture() {
        Logger::global().removeSink(sink);
        Logger::global().setMinLevel(_previous);
    }

    std::shared_ptr<CaptureSink> sink;

private:
    LogLevel _previous;
};
}

TEST(Logger, Log_DispatchesToSinksAboveMinLevel) {
    Logger logger("test");
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);
    logger.setMinLevel(LogLevel::Info);

    logger.debug("Cat", "hidden");
    logger.info("Cat", "shown");
    logger.error("Other", "also shown");

    auto entries = sink->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "shown");
    EXPECT_EQ(entries[0].category, "Cat");
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[1].level, LogLevel::Error);
    EXPECT_EQ(entries[1].threadId, std::this_thread::get_id());
}

TEST(Logger, SinkLevel_FiltersIndependently) {
    Logger logger("test");
    auto quiet = std::make_shared<CaptureSink>();
    auto chatty = std::make_shared<CaptureSink>();
    quiet->setMinLevel(LogLevel::Error);
    logger.addSink(quiet);
    logger.addSink(chatty);
    logger.setMinLevel(LogLevel::Trace);

    logger.warning("X", "warn");
    logger.fatal("X", "fatal");

    EXPECT_EQ(quiet->entries().size(), 1u);
    EXPECT_EQ(chatty->entries().size(), 2u);
}

TEST(Logger, OffLevel_SuppressesEverything) {
    Logger logger("test");
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);
    logger.setMinLevel(LogLevel::Off);

    logger.fatal("X", "nothing");
    EXPECT_FALSE(logger.isEnabled(LogLevel::Fatal));
    EXPECT_TRUE(sink->entries().empty());
}

TEST(Logger, SinkManagement_AndFlush) {
    Logger logger("named");
    EXPECT_EQ(logger.name(), "named");
    auto a = std::make_shared<CaptureSink>();
    auto b = std::make_shared<CaptureSink>();
    logger.addSink(a);
    logger.addSink(b);
    EXPECT_EQ(logger.sinkCount(), 2u);

    logger.flush();
    EXPECT_EQ(a->flushes, 1);

    logger.removeSink(a);
    EXPECT_EQ(logger.sinkCount(), 1u);
    logger.clearSinks();
    EXPECT_EQ(logger.sinkCount(), 0u);
}

TEST(Logger, CategoryMacros_UseGlobalLogger) {
    GlobalCapture capture;
    STEVEDORE_LOG_WARNING_CAT("Operations", "something odd");

    bool found = false;
    for (const auto& e : capture.sink->entries()) {
        if (e.category == "Operations" && e.message == "something odd" && e.level == LogLevel::Warning) found = true;
    }
    EXPECT_TRUE(found);
}

TEST(Logger, CShim_FormatsPrintfStyle) {
    GlobalCapture capture;
    stevedore_log_write_cat(STEVEDORE_LOG_INFO_C, "CApi", "%d blocks of %s", 3, "64 bytes");
    stevedore_log_write(STEVEDORE_LOG_ERROR_C, "plain %s", "message");

    bool formatted = false;
    bool plain = false;
    for (const auto& e : capture.sink->entries()) {
        if (e.category == "CApi" && e.message == "3 blocks of 64 bytes") formatted = true;
        if (e.category == "C" && e.message == "plain message" && e.level == LogLevel::Error) plain = true;
    }
    EXPECT_TRUE(formatted);
    EXPECT_TRUE(plain);
}

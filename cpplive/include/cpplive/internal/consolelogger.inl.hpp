/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../utils/consolelogger.hpp"
#include "../api.hpp"

namespace live
{

namespace utils
{

//******************************************************************************
// ConsoleLoggerOptions
//******************************************************************************

CPPLIVE_INLINE ConsoleLoggerOptions&
ConsoleLoggerOptions::withOriginLabel(std::string originLabel)
{
    originLabel_ = std::move(originLabel);
    return *this;
}

CPPLIVE_INLINE ConsoleLoggerOptions&
ConsoleLoggerOptions::withFlushOnWrite(bool enabled)
{
    flushOnWriteEnabled_ = enabled;
    return *this;
}

CPPLIVE_INLINE ConsoleLoggerOptions&
ConsoleLoggerOptions::withColor(bool enabled)
{
    colorEnabled_ = enabled;
    return *this;
}

CPPLIVE_INLINE const std::string& ConsoleLoggerOptions::originLabel() const
{
    return originLabel_;
}

CPPLIVE_INLINE bool ConsoleLoggerOptions::flushOnWriteEnabled() const
{
    return flushOnWriteEnabled_;
}

CPPLIVE_INLINE bool ConsoleLoggerOptions::colorEnabled() const
{
    return colorEnabled_;
}


//******************************************************************************
// ConsoleLogger
//******************************************************************************

//------------------------------------------------------------------------------
struct ConsoleLogger::Impl
{
    explicit Impl(ConsoleLoggerOptions options) : options(std::move(options)) {}

    void write(std::ostream& out, const LogEntry& entry) const
    {
        if (options.colorEnabled())
            toColorStream(out, entry, options.originLabel());
        else
            toStream(out, entry, options.originLabel());
    }

    ConsoleLoggerOptions options;
};

CPPLIVE_INLINE ConsoleLogger::ConsoleLogger(Options options)
    : impl_(std::make_shared<Impl>(std::move(options)))
{}

CPPLIVE_INLINE void ConsoleLogger::operator()(const LogEntry& entry) const
{
    if (entry.severity() < LogLevel::warning)
    {
        impl_->write(std::clog, entry);
        std::clog << "\n";
        if (impl_->options.flushOnWriteEnabled())
            std::clog << std::flush;
    }
    else
    {
        impl_->write(std::cerr, entry);
        std::cerr << std::endl;
    }
}

} // namespace utils

} // namespace live

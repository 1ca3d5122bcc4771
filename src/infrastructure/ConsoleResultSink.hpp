/**
 * @file ConsoleResultSink.hpp
 * @brief Prints one tagged line per result or status.
 */

#pragma once

#include <iostream>
#include <mutex>
#include "domain/FrameResult.hpp"

namespace bidlens::infrastructure {

class ConsoleResultSink : public domain::ResultSink {
public:
    explicit ConsoleResultSink(std::ostream& out = std::cout) : m_out(out) {}

    void publishResult(const domain::FrameResult& result) override;
    void publishStatus(const std::string& message, std::uint64_t frameIndex) override;

    static std::string FormatResult(const domain::FrameResult& result);

private:
    std::ostream& m_out;
    std::mutex m_mutex;
};

} // namespace bidlens::infrastructure

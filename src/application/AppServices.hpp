/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/FrameOrchestrator.hpp"
#include "application/PriceResolver.hpp"
#include "application/SessionContext.hpp"
#include "application/SpeechTranscriber.hpp"
#include "application/TextRecognizer.hpp"
#include "domain/AdvisoryService.hpp"
#include "infrastructure/PriceCache.hpp"
#include "infrastructure/SessionLogStore.hpp"

namespace bidlens::application {

/// Declaration order is destruction order in reverse: the orchestrator goes first.
struct AppServices {
    std::shared_ptr<AsyncTaskManager> taskManager;
    std::shared_ptr<infrastructure::PriceCache> priceCache;
    std::shared_ptr<infrastructure::SessionLogStore> sessionLog;
    std::shared_ptr<domain::AdvisoryService> advisory;
    std::shared_ptr<PriceResolver> priceResolver;
    std::unique_ptr<TextRecognizer> textRecognizer;
    std::unique_ptr<SpeechTranscriber> speechTranscriber;
    std::unique_ptr<SessionContext> session;
    std::unique_ptr<FrameOrchestrator> orchestrator;
};

} // namespace bidlens::application

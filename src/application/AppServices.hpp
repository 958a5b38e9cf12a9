/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/DiscrepancyReviewService.hpp"
#include "application/PipelineConfig.hpp"
#include "application/ReportPipelineService.hpp"
#include "domain/FactRepository.hpp"
#include "domain/MetricDictionary.hpp"

namespace finfacts::application {

struct AppServices {
    PipelineConfig config;
    std::shared_ptr<domain::FactRepository> repository;
    std::shared_ptr<AsyncTaskManager> taskManager;
    std::shared_ptr<DiscrepancyReviewService> reviewService;
    domain::MetricDictionaryPtr dictionary;             ///< Loaded only for commands that extract or resolve.
    std::unique_ptr<ReportPipelineService> pipelineService;
};

} // namespace finfacts::application

/**
 * @file ReviewHttpServer.hpp
 * @brief JSON-over-HTTP surface for discrepancy review and read-only fact access.
 */

#pragma once

#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "application/DiscrepancyReviewService.hpp"
#include "domain/FactRepository.hpp"

namespace httplib {
class Server;
}

namespace finfacts::infrastructure {

/**
 * @struct ApiResponse
 */
struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

/**
 * @class ReviewApi
 * @brief Route handlers independent of the transport.
 *
 * Errors map to HTTP codes: std::invalid_argument 400, std::out_of_range 404,
 * std::logic_error 409, anything else 500.
 */
class ReviewApi {
public:
    ReviewApi(std::shared_ptr<application::DiscrepancyReviewService> review,
              std::shared_ptr<domain::FactRepository> repository);

    /** @brief GET /reports */
    ApiResponse reports() const;

    /** @brief GET /reports/{id}/discrepancies?fact_type=&fiscal_year=&period= */
    ApiResponse listDiscrepancies(const std::string& reportId,
                                  const std::map<std::string, std::string>& query) const;

    /** @brief POST /reports/{id}/resolutions with {fact_type, candidate_id, reviewer, notes}. */
    ApiResponse submitResolution(const std::string& reportId, const std::string& body) const;

    /** @brief GET /reports/{id}/run-report */
    ApiResponse latestRunReport(const std::string& reportId) const;

    /** @brief GET /reports/{id}/facts */
    ApiResponse facts(const std::string& reportId) const;

    ApiResponse health() const;

private:
    template <typename Handler>
    ApiResponse guarded(Handler&& handler) const;

    std::shared_ptr<application::DiscrepancyReviewService> m_review;
    std::shared_ptr<domain::FactRepository> m_repository;
};

/**
 * @class ReviewHttpServer
 * @brief Binds ReviewApi to cpp-httplib routes.
 */
class ReviewHttpServer {
public:
    explicit ReviewHttpServer(std::shared_ptr<ReviewApi> api);
    ~ReviewHttpServer();

    ReviewHttpServer(const ReviewHttpServer&) = delete;
    ReviewHttpServer& operator=(const ReviewHttpServer&) = delete;

    /** @brief Blocks serving requests until stop(). Returns false if the address could not be bound. */
    bool listen(const std::string& host, int port);

    void stop();

private:
    void registerRoutes();

    std::shared_ptr<ReviewApi> m_api;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace finfacts::infrastructure

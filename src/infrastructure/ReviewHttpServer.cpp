/**
 * @file ReviewHttpServer.cpp
 * @brief Implementation of ReviewApi and ReviewHttpServer.
 */

#include "infrastructure/ReviewHttpServer.hpp"

#include <iostream>
#include <stdexcept>

#include <httplib.h>

#include "infrastructure/FactJson.hpp"

namespace finfacts::infrastructure {

using application::DiscrepancyFilter;
using application::ResolutionRequest;

namespace {

ApiResponse Error(int status, const std::string& message) {
    return {status, {{"error", message}}};
}

std::string QueryValue(const std::map<std::string, std::string>& query, const std::string& key) {
    auto it = query.find(key);
    return it == query.end() ? "" : it->second;
}

std::string RequiredString(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument(std::string("'") + key + "' is required");
    }
    return it->get<std::string>();
}

} // namespace

ReviewApi::ReviewApi(std::shared_ptr<application::DiscrepancyReviewService> review,
                     std::shared_ptr<domain::FactRepository> repository)
    : m_review(std::move(review)), m_repository(std::move(repository)) {}

template <typename Handler>
ApiResponse ReviewApi::guarded(Handler&& handler) const {
    try {
        return handler();
    } catch (const json::exception& e) {
        return Error(400, std::string("malformed JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return Error(400, e.what());
    } catch (const std::out_of_range& e) {
        return Error(404, e.what());
    } catch (const std::logic_error& e) {
        return Error(409, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[ReviewServer] Internal error: " << e.what() << std::endl;
        return Error(500, e.what());
    }
}

ApiResponse ReviewApi::reports() const {
    return guarded([&]() {
        json ids = json::array();
        for (const auto& reportId : m_repository->listReports()) ids.push_back(reportId);
        return ApiResponse{200, {{"count", ids.size()}, {"reports", ids}}};
    });
}

ApiResponse ReviewApi::listDiscrepancies(const std::string& reportId,
                                         const std::map<std::string, std::string>& query) const {
    return guarded([&]() {
        DiscrepancyFilter filter;
        filter.reportId = reportId;

        const std::string factType = QueryValue(query, "fact_type");
        if (!factType.empty()) {
            if (factType != "stock" && factType != "flow") {
                throw std::invalid_argument("fact_type must be 'stock' or 'flow'");
            }
            filter.factType = domain::FactTypeFromString(factType);
        }
        const std::string fiscalYear = QueryValue(query, "fiscal_year");
        if (!fiscalYear.empty()) {
            try {
                filter.fiscalYear = std::stoi(fiscalYear);
            } catch (const std::exception&) {
                throw std::invalid_argument("fiscal_year must be a number");
            }
        }
        filter.period = QueryValue(query, "period");

        json items = json::array();
        for (const auto& discrepancy : m_review->listDiscrepancies(filter)) {
            json item = ToJson(discrepancy.fact);
            item["candidates"] = json::array();
            for (const auto& candidate : discrepancy.candidates) item["candidates"].push_back(ToJson(candidate));
            items.push_back(std::move(item));
        }
        return ApiResponse{200, {{"report_id", reportId}, {"count", items.size()}, {"discrepancies", items}}};
    });
}

ApiResponse ReviewApi::submitResolution(const std::string& reportId, const std::string& body) const {
    return guarded([&]() {
        json request = json::parse(body);
        if (!request.is_object()) {
            throw std::invalid_argument("request body must be a JSON object");
        }
        ResolutionRequest resolution;
        resolution.reportId = reportId;
        resolution.factType = RequiredString(request, "fact_type");
        resolution.candidateId = RequiredString(request, "candidate_id");
        resolution.reviewer = RequiredString(request, "reviewer");
        resolution.notes = request.value("notes", "");
        return ApiResponse{200, ToJson(m_review->submitResolution(resolution))};
    });
}

ApiResponse ReviewApi::latestRunReport(const std::string& reportId) const {
    return guarded([&]() {
        auto report = m_repository->loadLatestRunReport(reportId);
        if (!report) {
            throw std::out_of_range("no run report for " + reportId);
        }
        return ApiResponse{200, json::parse(*report)};
    });
}

ApiResponse ReviewApi::facts(const std::string& reportId) const {
    return guarded([&]() {
        json items = json::array();
        for (const auto& fact : m_review->listFacts(reportId)) items.push_back(ToJson(fact));
        return ApiResponse{200, {{"report_id", reportId}, {"count", items.size()}, {"facts", items}}};
    });
}

ApiResponse ReviewApi::health() const {
    return {200, {{"status", "ok"}}};
}

ReviewHttpServer::ReviewHttpServer(std::shared_ptr<ReviewApi> api)
    : m_api(std::move(api)), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

ReviewHttpServer::~ReviewHttpServer() {
    stop();
}

void ReviewHttpServer::registerRoutes() {
    auto reply = [](httplib::Response& res, const ApiResponse& response) {
        res.status = response.status;
        res.set_content(response.body.dump(2), "application/json");
    };

    m_server->Get("/health", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, m_api->health());
    });

    m_server->Get("/reports", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, m_api->reports());
    });

    m_server->Get(R"(/reports/([^/]+)/discrepancies)",
                  [this, reply](const httplib::Request& req, httplib::Response& res) {
        std::map<std::string, std::string> query;
        for (const auto& [key, value] : req.params) query[key] = value;
        reply(res, m_api->listDiscrepancies(req.matches[1], query));
    });

    m_server->Post(R"(/reports/([^/]+)/resolutions)",
                   [this, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, m_api->submitResolution(req.matches[1], req.body));
    });

    m_server->Get(R"(/reports/([^/]+)/run-report)",
                  [this, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, m_api->latestRunReport(req.matches[1]));
    });

    m_server->Get(R"(/reports/([^/]+)/facts)",
                  [this, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, m_api->facts(req.matches[1]));
    });
}

bool ReviewHttpServer::listen(const std::string& host, int port) {
    std::cout << "[ReviewServer] Listening on http://" << host << ":" << port << std::endl;
    bool ok = m_server->listen(host.c_str(), port);
    if (!ok) {
        std::cerr << "[ReviewServer] Could not bind " << host << ":" << port << std::endl;
    }
    return ok;
}

void ReviewHttpServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

} // namespace finfacts::infrastructure

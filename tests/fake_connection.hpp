#ifndef HARMONIA_TESTS_FAKE_CONNECTION_HPP
#define HARMONIA_TESTS_FAKE_CONNECTION_HPP

#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <boost/beast/http/error.hpp>
#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>
#include <harmonia/rest_client.hpp>
#include <harmonia/ratelimit_lock.hpp>
#include <harmonia/internal/rest.hpp>

namespace Harmonia { namespace Testing {
    /// Shared state of all connections created by one factory.
    struct FakeServer {
        /// Requests with connection headers merged in.
        std::vector<REST::HTTPRequest> requests;
        std::deque<REST::HTTPResponse> responses;

        unsigned connectionsCreated = 0;

        /// Next N requests fail as if server closed connection.
        unsigned dropNext = 0;

        void reply(unsigned statusCode, const std::string& body = "", const REST::HeadersMap& headers = {}) {
            REST::HTTPResponse response;
            response.statusCode = statusCode;
            response.headers    = headers;
            response.body       = std::vector<uint8_t>(body.begin(), body.end());
            responses.push_back(response);
        }

        void replyJson(unsigned statusCode, const nlohmann::json& body, const REST::HeadersMap& headers = {}) {
            reply(statusCode, body.dump(), headers);
        }

        const REST::HTTPRequest& last() const {
            return requests.back();
        }
    };

    class FakeConnection : public REST::HTTPConnection {
    public:
        explicit FakeConnection(std::shared_ptr<FakeServer> server) : server(std::move(server)) {}

        void open() override { alive = true; }
        void close() override { alive = false; }
        bool isOpen() const override { return alive; }

        REST::HTTPResponse request(const REST::HTTPRequest& request) override {
            if (server->dropNext > 0) {
                --server->dropNext;
                alive = false;
                throw boost::system::system_error(
                    boost::beast::http::make_error_code(boost::beast::http::error::end_of_stream));
            }

            REST::HTTPRequest recorded = request;
            for (const auto& header : connectionHeaders) recorded.headers.insert(header);
            server->requests.push_back(recorded);

            if (server->responses.empty()) {
                REST::HTTPResponse noContent;
                noContent.statusCode = 204;
                return noContent;
            }

            REST::HTTPResponse response = server->responses.front();
            server->responses.pop_front();
            return response;
        }

    private:
        std::shared_ptr<FakeServer> server;
        bool alive = false;
    };

    inline RestClient::ConnectionFactory fakeFactory(std::shared_ptr<FakeServer> server) {
        return [server]() {
            ++server->connectionsCreated;
            return std::unique_ptr<REST::HTTPConnection>(new FakeConnection(server));
        };
    }

    /// Time source that advances only when somebody sleeps.
    struct FakeClock {
        RatelimitLock::TimePoint current = RatelimitLock::TimePoint() + std::chrono::hours(1);
        std::vector<RatelimitLock::Clock::duration> sleeps;

        RatelimitLock::NowFunction nowFunction() {
            return [this]() { return current; };
        }

        RatelimitLock::SleepFunction sleepFunction() {
            return [this](RatelimitLock::Clock::duration duration) {
                sleeps.push_back(duration);
                current += duration;
            };
        }

        void advance(double seconds) {
            current += std::chrono::duration_cast<RatelimitLock::Clock::duration>(
                std::chrono::duration<double>(seconds));
        }

        double totalSlept() const {
            RatelimitLock::Clock::duration total = RatelimitLock::Clock::duration::zero();
            for (const auto& duration : sleeps) total += duration;
            return std::chrono::duration_cast<std::chrono::duration<double> >(total).count();
        }
    };

    inline std::string bodyOf(const REST::HTTPRequest& request) {
        return std::string(request.body.begin(), request.body.end());
    }

    inline nlohmann::json jsonOf(const REST::HTTPRequest& request) {
        return nlohmann::json::parse(request.body.begin(), request.body.end());
    }

    inline std::string header(const REST::HTTPRequest& request, const std::string& name) {
        auto it = request.headers.find(name);
        return it != request.headers.end() ? it->second : std::string();
    }

    inline bool hasHeader(const REST::HTTPRequest& request, const std::string& name) {
        return request.headers.find(name) != request.headers.end();
    }

    /// Base fixture: RestClient wired to fake server and fake clock.
    class RestClientTest : public ::testing::Test {
    protected:
        RestClientTest()
            : server(std::make_shared<FakeServer>())
            , client(fakeFactory(server), "secret", TokenType::Bot,
                     clock.nowFunction(), clock.sleepFunction()) {}

        std::string api(const std::string& path) const {
            return RestClient::restBasePath() + path;
        }

        std::shared_ptr<FakeServer> server;
        FakeClock clock;
        RestClient client;
    };
}} // namespace Harmonia::Testing

#endif // HARMONIA_TESTS_FAKE_CONNECTION_HPP

#ifndef DESKPILOT_CHAT_MODEL_ENDPOINT_H
#define DESKPILOT_CHAT_MODEL_ENDPOINT_H

#include <memory>
#include <string>
#include "reasoning_endpoint.h"
#include "../common/run_config.h"

namespace deskpilot {

/**
 * @brief Carries a chat payload to a model server and returns the reply text
 *
 * The wire protocol (HTTP, local socket, in-process runtime) is up to the
 * implementation.
 */
class InferenceTransport {
public:
    virtual ~InferenceTransport() = default;

    virtual std::string complete(const std::string& model,
                                 const nlohmann::json& payload,
                                 std::chrono::milliseconds timeout,
                                 const CancellationToken& token) = 0;

    virtual bool ping(const std::string& model) { (void)model; return true; }
};

/**
 * @brief ReasoningEndpoint speaking a chat-completion style payload
 */
class ChatModelEndpoint : public ReasoningEndpoint {
public:
    ChatModelEndpoint(const EndpointConfig& config, std::shared_ptr<InferenceTransport> transport);

    const std::string& name() const override { return m_config.name; }
    std::chrono::milliseconds timeout() const override { return m_config.timeout; }
    bool supportsVision() const override { return m_config.vision; }
    bool isAvailable() override;

    std::string infer(const ReasoningRequest& request,
                      std::chrono::milliseconds timeout,
                      const CancellationToken& token) override;

    nlohmann::json buildPayload(const ReasoningRequest& request) const;

    static const std::string& systemPrompt();

private:
    EndpointConfig m_config;
    std::shared_ptr<InferenceTransport> m_transport;
};

} // namespace deskpilot

#endif // DESKPILOT_CHAT_MODEL_ENDPOINT_H

/**
 * @file LanguageModelService.hpp
 * @brief Interface for the text-generation endpoint.
 */

#pragma once
#include <functional>
#include <string>
#include <vector>
#include "domain/Cancellation.hpp"
#include "domain/Errors.hpp"

namespace localkb::domain {

/**
 * @struct GenerationOptions
 * @brief Sampling parameters sent with a generation request.
 *
 * Valid ranges: temperature [0,2], topP [0,1], topK [1,100], maxTokens [1,10000].
 */
struct GenerationOptions {
    double temperature = 0.7;
    double topP = 0.9;
    int topK = 40;
    int maxTokens = 2000;
    std::vector<std::string> stop = {"[DONE]", "<|im_end|>"};

    /** @throws QaError(InvalidParameter) naming the first out-of-range field. */
    void validate() const {
        auto reject = [](const std::string& name, const std::string& value, const std::string& range) {
            throw QaError(ErrorCode::InvalidParameter,
                          name + " must be within " + range,
                          {{"parameter", name}, {"value", value}, {"range", range}});
        };
        if (temperature < 0.0 || temperature > 2.0) reject("temperature", std::to_string(temperature), "[0, 2]");
        if (topP < 0.0 || topP > 1.0) reject("top_p", std::to_string(topP), "[0, 1]");
        if (topK < 1 || topK > 100) reject("top_k", std::to_string(topK), "[1, 100]");
        if (maxTokens < 1 || maxTokens > 10000) reject("max_tokens", std::to_string(maxTokens), "[1, 10000]");
    }
};

/**
 * @class LanguageModelService
 * @brief Abstract local LLM.
 */
class LanguageModelService {
public:
    virtual ~LanguageModelService() = default;

    /** @brief Receives each streamed fragment in order. */
    using FragmentSink = std::function<void(const std::string&)>;

    /**
     * @brief Blocking generation.
     * @return The complete response text.
     * @throws QaError with GenerationUnreachable, GenerationTimeout, InvalidParameter or GenerationFailed.
     */
    virtual std::string generate(const std::string& prompt, const GenerationOptions& options) = 0;

    /**
     * @brief Streaming generation; fragments are pushed to sink until the model reports done.
     * @throws OperationCancelled when the token fires between fragments.
     */
    virtual void generateStream(const std::string& prompt,
                                const GenerationOptions& options,
                                const FragmentSink& sink,
                                const CancellationToken& cancellation = CancellationToken::None()) = 0;

    /** @brief Names reported by the model endpoint; empty when unreachable. */
    virtual std::vector<std::string> listModels() = 0;

    /** @brief Exact match first, then a base-name (before ':') match. */
    virtual bool isModelAvailable(const std::string& modelName) = 0;

    virtual std::string getCurrentModel() const = 0;
};

} // namespace localkb::domain

#include <cassert>
#include <cmath>
#include <iostream>
#include "application/TopicResolver.hpp"

using namespace orion::application;
using orion::domain::Topic;

namespace {

Clock FixedClock(std::int64_t value) {
    return [value] { return value; };
}

KnownTopic Known(const std::string& id, const std::string& label, int uses,
                 std::optional<std::vector<float>> embedding) {
    KnownTopic known;
    known.topic.id = id;
    known.topic.label = label;
    known.topic.uses = uses;
    known.topic.createdAt = 1;
    known.embedding = std::move(embedding);
    return known;
}

const std::vector<float> kTransformer{1.0f, 0.0f, 0.0f};
const std::vector<float> kTransformerVariant{0.97f, 0.2431f, 0.0f}; // cosine 0.97 to kTransformer
const std::vector<float> kAttention{0.0f, 1.0f, 0.0f};
const std::vector<float> kTokenizer{0.3f, 0.3f, 0.9f};

} // namespace

int main() {
    std::cout << "[Test] Starting TopicResolver Test..." << std::endl;

    // Fresh graph: every label mints a topic.
    {
        TopicResolver resolver(0.85f, SequentialIdFactory("t"), FixedClock(1000));
        auto result = resolver.resolve({{"transformer", kTransformer}, {"attention", kAttention}}, {});
        assert(result.resolved.size() == 2);
        assert(result.newIndices == (std::vector<std::size_t>{0, 1}));
        assert(result.reusedTopicIds.empty());
        assert(result.resolved[0].topic.id == "t-1" && result.resolved[1].topic.id == "t-2");
        assert(result.resolved[0].topic.uses == 1 && result.resolved[1].topic.uses == 1);
        assert(result.resolved[0].topic.createdAt == 1000);
        assert(result.resolved[0].isNew && result.resolved[1].isNew);
    }
    std::cout << "[PASS] New labels mint topics." << std::endl;

    std::vector<KnownTopic> existing{
        Known("t-1", "transformer", 1, kTransformer),
        Known("t-2", "attention", 1, kAttention),
    };

    // Exact label match reuses the topic and only bumps uses.
    {
        TopicResolver resolver(0.85f, SequentialIdFactory("u"), FixedClock(2000));
        auto result = resolver.resolve({{"transformer", kTransformerVariant}, {"tokenizer", kTokenizer}}, existing);
        assert(result.resolved[0].topic.id == "t-1");
        assert(result.resolved[0].exactMatch && !result.resolved[0].isNew);
        assert(result.resolved[0].topic.uses == 2);
        assert(result.newIndices == (std::vector<std::size_t>{1}));
        assert(result.resolved[1].topic.id == "u-1" && result.resolved[1].topic.label == "tokenizer");
        assert(result.reusedTopicIds == (std::vector<std::string>{"t-1"}));
    }
    std::cout << "[PASS] Exact match reuses topic." << std::endl;

    // A different label with a near-identical embedding merges.
    {
        TopicResolver resolver(0.85f, SequentialIdFactory("u"), FixedClock(2000));
        auto result = resolver.resolve({{"transformers", kTransformerVariant}}, existing);
        assert(result.newIndices.empty());
        assert(result.resolved[0].topic.id == "t-1");
        assert(!result.resolved[0].exactMatch);
        assert(std::fabs(result.resolved[0].similarity - 0.97f) < 1e-3f);
        assert(result.resolved[0].topic.uses == 2);
    }
    std::cout << "[PASS] Semantic merge above threshold." << std::endl;

    // Same existing topic referenced twice in a batch counts once.
    {
        TopicResolver resolver(0.85f, SequentialIdFactory("u"), FixedClock(2000));
        auto result = resolver.resolve({{"transformer", kTransformer}, {"transformers", kTransformerVariant}}, existing);
        assert(result.reusedTopicIds.size() == 1);
        assert(result.resolved[0].topic.id == result.resolved[1].topic.id);
        assert(result.resolved[0].topic.uses == 2 && result.resolved[1].topic.uses == 2);
    }
    std::cout << "[PASS] Reused topic counted once per batch." << std::endl;

    // Duplicates inside one batch resolve to the same minted topic.
    {
        TopicResolver resolver(0.85f, SequentialIdFactory("v"), FixedClock(3000));
        auto result = resolver.resolve({{"x", {1.0f, 0.0f}}, {"x", {0.0f, 1.0f}}}, {});
        assert(result.newIndices.size() == 1);
        assert(result.resolved[1].exactMatch && !result.resolved[1].isNew);
        assert(result.resolved[0].topic.id == result.resolved[1].topic.id);

        auto near = resolver.resolve({{"a", {1.0f, 0.0f}}, {"b", {0.99f, 0.141f}}}, {});
        assert(near.newIndices == (std::vector<std::size_t>{0}));
        assert(near.resolved[1].topic.id == near.resolved[0].topic.id);
        assert(near.resolved[1].topic.label == "a");
    }
    std::cout << "[PASS] In-batch duplicates collapse." << std::endl;

    // Topics without a stored embedding only match by label; a high threshold keeps labels apart.
    {
        std::vector<KnownTopic> orphan{Known("o-1", "orphan", 3, std::nullopt)};
        TopicResolver resolver(0.85f, SequentialIdFactory("w"), FixedClock(4000));
        auto result = resolver.resolve({{"orphans", {1.0f, 0.0f}}, {"orphan", {0.0f, 1.0f}}}, orphan);
        assert(result.newIndices == (std::vector<std::size_t>{0}));
        assert(result.resolved[1].topic.id == "o-1" && result.resolved[1].topic.uses == 4);

        TopicResolver strict(0.99f, SequentialIdFactory("s"), FixedClock(4000));
        auto apart = strict.resolve({{"transformers", kTransformerVariant}}, existing);
        assert(apart.newIndices.size() == 1 && apart.resolved[0].topic.id == "s-1");
    }
    std::cout << "[PASS] Threshold and missing embeddings." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

#include <keylock/keylock.hpp>
#include <kitties/ledger/entropy.hpp>
#include <random>

namespace kitties {

    SeededEntropySource::SeededEntropySource(std::vector<uint8_t> seed) : seed_(std::move(seed)) {}

    std::vector<uint8_t> SeededEntropySource::randomSeed(dp::usize length) {
        std::random_device device;
        std::uniform_int_distribution<int> byte_dist(0, 255);
        std::vector<uint8_t> seed(length);
        for (auto &byte : seed)
            byte = static_cast<uint8_t>(byte_dist(device));
        return seed;
    }

    dp::Result<Genome, dp::Error> SeededEntropySource::derive(const EntropyContext &context) {
        std::vector<uint8_t> payload;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            payload = seed_;
        }
        payload.insert(payload.end(), context.caller.begin(), context.caller.end());
        for (int shift = 0; shift < 64; shift += 8)
            payload.push_back(static_cast<uint8_t>((context.call_index >> shift) & 0xff));

        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto hash_result = crypto.hash(payload);
        if (!hash_result.success) {
            return dp::Result<Genome, dp::Error>::err(entropy_failed(dp::String(hash_result.error_message.c_str())));
        }
        if (hash_result.data.size() < GENOME_SIZE) {
            return dp::Result<Genome, dp::Error>::err(entropy_failed("Hash output too short"));
        }

        Genome genome = {};
        for (dp::usize i = 0; i < GENOME_SIZE; ++i)
            genome[i] = hash_result.data[i];
        return dp::Result<Genome, dp::Error>::ok(genome);
    }

    void SeededEntropySource::reseed(std::vector<uint8_t> seed) {
        std::lock_guard<std::mutex> lock(mutex_);
        seed_ = std::move(seed);
    }

    std::vector<uint8_t> SeededEntropySource::getSeed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seed_;
    }

    FixedEntropySource::FixedEntropySource(std::vector<Genome> genomes) : genomes_(std::move(genomes)) {}

    dp::Result<Genome, dp::Error> FixedEntropySource::derive(const EntropyContext &context) {
        std::lock_guard<std::mutex> lock(mutex_);
        contexts_.push_back(context);
        if (genomes_.empty()) {
            return dp::Result<Genome, dp::Error>::err(entropy_failed("No pinned genome available"));
        }
        if (position_ < genomes_.size())
            return dp::Result<Genome, dp::Error>::ok(genomes_[position_++]);
        return dp::Result<Genome, dp::Error>::ok(genomes_.back());
    }

    void FixedEntropySource::push(const Genome &genome) {
        std::lock_guard<std::mutex> lock(mutex_);
        genomes_.push_back(genome);
    }

    std::vector<EntropyContext> FixedEntropySource::getContexts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contexts_;
    }

    size_t FixedEntropySource::getCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contexts_.size();
    }

} // namespace kitties

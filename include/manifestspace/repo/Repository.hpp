#pragma once

#include "manifest/ManifestIndex.hpp"
#include "repo/ClientOptions.hpp"

#include <memory>
#include <utility>

namespace MS {

// A connected repository: the shared manifest index plus the identity of this client.
class Repository {
public:
    Repository(std::shared_ptr<Manifest::ManifestIndex> manifests, ClientOptions options)
        : index(std::move(manifests)), client(std::move(options)) {}

    [[nodiscard]] auto manifests() const -> Manifest::ManifestIndex& { return *this->index; }
    [[nodiscard]] auto clientOptions() const -> ClientOptions const& { return this->client; }

private:
    std::shared_ptr<Manifest::ManifestIndex> index;
    ClientOptions                            client;
};

} // namespace MS

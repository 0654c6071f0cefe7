#pragma once

#include "resolver.hpp"
#include <memory>

namespace subscout {
namespace resolve {

// Feeds candidates to an external batch resolver in fixed-size chunks. A
// chunk whose process exits non-zero is discarded. If the binary cannot be
// started at all, the remaining candidates go to the fallback backend.
class BatchResolver : public ResolverBackend {
public:
    BatchResolver(std::string binary,
                  std::string resolvers_file,
                  int batch_size,
                  std::shared_ptr<ResolverBackend> fallback);

    std::string name() const override;
    void resolve(const std::vector<std::string>& candidates, const RecordCallback& on_record) override;

private:
    std::string binary_;
    std::string resolvers_file_;
    int batch_size_;
    std::shared_ptr<ResolverBackend> fallback_;
};

}}

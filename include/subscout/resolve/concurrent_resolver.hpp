#pragma once

#include "resolver.hpp"
#include <memory>

namespace subscout {
namespace resolve {

class ConcurrentResolver : public ResolverBackend {
public:
    ConcurrentResolver(std::shared_ptr<dns::DnsClient> dns, int concurrency);

    std::string name() const override;
    void resolve(const std::vector<std::string>& candidates, const RecordCallback& on_record) override;

private:
    std::shared_ptr<dns::DnsClient> dns_;
    int concurrency_;
};

}}

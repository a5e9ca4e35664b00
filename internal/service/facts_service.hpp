#pragma once

#include "heartbeat/v1.hpp"
#include "service_context.hpp"

namespace heartbeat::service {

class FactsService {
public:
  explicit FactsService(ServiceContext ctx);

  heartbeat::v1::RecordFactResponse
  RecordFact(const heartbeat::v1::RecordFactRequest& req);

  heartbeat::v1::ListFactsResponse
  ListFacts(const heartbeat::v1::ListFactsRequest& req);

private:
  ServiceContext ctx_;
};

}

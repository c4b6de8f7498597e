#include "executor/executor_client.hpp"

namespace arbiter::executor {

executor_client::~executor_client() {}

}  // namespace arbiter::executor

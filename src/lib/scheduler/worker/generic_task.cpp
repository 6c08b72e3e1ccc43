#include "generic_task.hpp"

namespace seqpart {

void GenericTask::OnExecute() { task_function_(); }

}  // namespace seqpart

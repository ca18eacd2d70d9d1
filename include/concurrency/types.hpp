#pragma once

#include <memory>
#include <variant>

namespace dm::types { struct Document; }

typedef std::variant<bool, std::shared_ptr<dm::types::Document>> ExpectedFuture;

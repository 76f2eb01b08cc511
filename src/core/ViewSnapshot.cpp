#include "core/ViewSnapshot.h"

namespace core {

std::shared_ptr<const ViewSnapshot> ViewSnapshot::bootstrap() {
    static const std::shared_ptr<const ViewSnapshot> initial = []() {
        auto snapshot = std::make_shared<ViewSnapshot>();
        snapshot->entities = std::make_shared<const EntityMap>();
        return std::shared_ptr<const ViewSnapshot>(std::move(snapshot));
    }();
    return initial;
}

}  // namespace core

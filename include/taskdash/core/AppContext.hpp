#pragma once

#include <memory>

#include "taskdash/core/AppConfig.hpp"

namespace taskdash {
namespace data {
class DataProvider;
class TaskRepository;
class OverlayRepository;
}

namespace core {

class AppContext
{
public:
    explicit AppContext(AppConfig config);
    ~AppContext();

    const AppConfig &config() const;
    data::TaskRepository &taskRepository();
    data::OverlayRepository &overlayRepository();

private:
    AppConfig m_config;
    std::unique_ptr<data::DataProvider> m_dataProvider;
};

} // namespace core
} // namespace taskdash

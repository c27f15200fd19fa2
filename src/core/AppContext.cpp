#include "taskdash/core/AppContext.hpp"

#include "taskdash/data/DataProvider.hpp"

namespace taskdash {
namespace core {

AppContext::AppContext(AppConfig config)
    : m_config(std::move(config))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_config.dataDirectory))
{
}

AppContext::~AppContext() = default;

const AppConfig &AppContext::config() const
{
    return m_config;
}

data::TaskRepository &AppContext::taskRepository()
{
    return m_dataProvider->taskRepository();
}

data::OverlayRepository &AppContext::overlayRepository()
{
    return m_dataProvider->overlayRepository();
}

} // namespace core
} // namespace taskdash

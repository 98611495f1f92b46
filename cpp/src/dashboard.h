#pragma once

#include <QString>

namespace roithumb {

// User-facing message channel of the hosting application (status bar, log panel)
class Dashboard {
public:
    virtual ~Dashboard() = default;

    virtual void displayMessage(const QString& message) = 0;
};

} // namespace roithumb

#pragma once
#include <memory>
#include <stdexcept>
#include <string>

namespace hostwatch {

struct PresenceEvent;

class NotifyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual std::string name() const = 0;
    virtual void notify(const PresenceEvent& event) = 0;
};

using NotifierPtr = std::unique_ptr<Notifier>;

}

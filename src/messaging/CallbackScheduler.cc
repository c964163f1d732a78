#include "messaging/CallbackScheduler.hh"

namespace Wizard {
namespace Messaging {

CallbackScheduler::~CallbackScheduler() = default;

}
}

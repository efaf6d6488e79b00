#include <util/message.h>

#include <ostream>

namespace util::message {

void vector::print(std::ostream &os) const {
  for (const auto &p : static_cast<const vec_t &>(*this))p->print(os);
}

void string::print(std::ostream &os) const {
  os << what << std::endl;
}

void progress::print(std::ostream &os) const {
  os << "[ " << what << " ]" << std::endl;
}

void emit(const base &msg, std::ostream &os) {
  msg.print(os);
  os.flush();
}

}

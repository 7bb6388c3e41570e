#ifndef VERSION_HPP
#define VERSION_HPP

namespace vigil {

constexpr const char* kVersion = "1.0.0";

} // namespace vigil

#endif // VERSION_HPP

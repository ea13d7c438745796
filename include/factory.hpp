#ifndef FACTORY_HPP
#define FACTORY_HPP

#include <map>
#include <memory>
#include <string>

#include "datatype.hpp"
#include "enums/qscheme.hpp"

namespace qconv {

template <class Base>
class Factory {
  using create = std::unique_ptr<Base> (*)();

 public:
  static auto &GetFactoryMap() {
    static std::map<std::string, create> map;

    return map;
  }

  static bool RegisterCreateFunction(std::string name, create function) {
    GetFactoryMap()[name] = function;

    return true;
  }

  static std::unique_ptr<Base> CreateInstance(std::string name) {
    std::unique_ptr<Base> p_instance = nullptr;
    auto it = GetFactoryMap().find(name);

    if (it != GetFactoryMap().end()) p_instance = it->second();

    return p_instance;
  }
};

template <class Base>
class ObserverFactory {
  using create = std::unique_ptr<Base> (*)(dty::DataType,
                                           quantization::QScheme, bool);

 public:
  static auto &GetFactoryMap() {
    static std::map<std::string, create> map;

    return map;
  }

  static bool RegisterCreateFunction(std::string name, create function) {
    GetFactoryMap()[name] = function;

    return true;
  }

  static std::unique_ptr<Base> CreateInstance(std::string name,
                                              dty::DataType dtype,
                                              quantization::QScheme qscheme,
                                              bool reduce_range = false) {
    std::unique_ptr<Base> p_observer = nullptr;
    auto it = GetFactoryMap().find(name);
    if (it != GetFactoryMap().end()) {
      p_observer = it->second(dtype, qscheme, reduce_range);
    }
    return p_observer;
  }
};

}  // namespace qconv

#endif  // FACTORY_HPP

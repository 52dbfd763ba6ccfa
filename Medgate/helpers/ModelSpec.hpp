#pragma once
#include <QDebug>
#include <QString>

#include <Medgate/helpers/OnnxBase.hpp>

#include <string>
#include <vector>

namespace Medgate::Onnx
{
struct ModelSpec
{
  struct Port
  {
    QString name;
    ONNXTensorElementDataType element_type{
        ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED};
    std::vector<int64_t> shape;
  };
  std::vector<Port> inputs;
  std::vector<Port> outputs;

  std::vector<std::string> input_names, output_names;
  std::vector<const char*> input_names_char;
  std::vector<const char*> output_names_char;
};

inline QDebug operator<<(QDebug s, const ModelSpec& spec)
{
  QDebugStateSaver saver(s);
  s.nospace() << "model with " << spec.inputs.size() << " inputs, "
              << spec.outputs.size() << " outputs";
  for (auto& port : spec.inputs)
    s << "\n - i: " << port.name << ' '
      << elementTypeName(port.element_type) << ' ' << port.shape;
  for (auto& port : spec.outputs)
    s << "\n - o: " << port.name << ' '
      << elementTypeName(port.element_type) << ' ' << port.shape;
  return s;
}
}

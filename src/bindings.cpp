/**
 * @file bindings.cpp
 * @brief Python bindings for the basE91 codecs.
 */

#include "base91_codec.hpp"
#include "base91_errors.hpp"
#include "base91_stream.hpp"
#include "b91_format.hpp"
#include <fstream>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace {

// py::bytes <-> std::string is a plain byte copy
std::string bytes_to_string(const py::bytes &data) { return data; }

std::ifstream open_input(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Cannot open input file: " + path);
  }
  return in;
}

std::ofstream open_output(const std::string &path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Cannot open output file: " + path);
  }
  return out;
}

} // namespace

PYBIND11_MODULE(base91, m) {
  m.doc() = "basE91 binary-to-text codec";

  // Raised as base91.CorruptInputError (a ValueError); the message carries
  // the offending input offset
  py::register_exception<CorruptInputError>(m, "CorruptInputError",
                                            PyExc_ValueError);

  m.attr("ALPHABET") = py::str(B91Format::ALPHABET);

  // --- ENCODE ---
  m.def(
      "encode",
      [](py::bytes data) {
        std::string encoded = Base91Codec().encode(bytes_to_string(data));
        return py::bytes(encoded);
      },
      "Encode bytes to basE91 text (returned as bytes).\n", py::arg("data"));

  // --- DECODE ---
  m.def(
      "decode",
      [](py::bytes encoded) {
        std::string decoded = Base91Codec().decode(bytes_to_string(encoded));
        return py::bytes(decoded);
      },
      "Decode basE91 text back to bytes. Raises CorruptInputError on bytes "
      "outside the alphabet.\n",
      py::arg("encoded"));

  m.def("encoded_len", &Base91Codec::encoded_len,
        "Upper bound on the encoded length of n bytes.\n", py::arg("n"));
  m.def("decoded_len", &Base91Codec::decoded_len,
        "Decoded length of n symbols when every pair carries 14 bits.\n",
        py::arg("n"));

  // --- FILES (streaming, constant memory) ---
  m.def(
      "encode_file",
      [](const std::string &input_path, const std::string &output_path) {
        std::ifstream in = open_input(input_path);
        std::ofstream out = open_output(output_path);
        IstreamSource source(in);
        OstreamSink sink(out);
        return encode_stream(source, sink);
      },
      "Stream-encode a file. Returns the number of symbols written.\n",
      py::arg("input_path"), py::arg("output_path"));

  m.def(
      "decode_file",
      [](const std::string &input_path, const std::string &output_path) {
        std::ifstream in = open_input(input_path);
        std::ofstream out = open_output(output_path);
        IstreamSource source(in);
        OstreamSink sink(out);
        return decode_stream(source, sink);
      },
      "Stream-decode a file. Returns the number of bytes written.\n",
      py::arg("input_path"), py::arg("output_path"));
}

#include <memory>
#include <utility>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "layoutprep/documents.hpp"
#include "layoutprep/featurizer.hpp"
#include "layoutprep/log.hpp"
#include "layoutprep/percentile.hpp"
#include "layoutprep/pipeline.hpp"
#include "layoutprep/settings.hpp"

namespace py = pybind11;
using namespace layoutprep;

namespace {

// Capsule owning one reference to the artifact.
py::capsule KeepAlive(std::shared_ptr<const Artifact> artifact) {
  auto holder = std::make_unique<std::shared_ptr<const Artifact>>(std::move(artifact));
  py::capsule capsule(holder.get(), [](void* p) { delete static_cast<std::shared_ptr<const Artifact>*>(p); });
  holder.release();
  return capsule;
}

// Read-only NumPy view of artifact memory. The capsule keeps the artifact alive
// for as long as the array exists.
template <typename T>
py::array_t<T> ArtifactArray(const T* data, std::vector<py::ssize_t> shape, std::vector<py::ssize_t> strides,
                             const std::shared_ptr<const Artifact>& artifact) {
  py::array_t<T> array(shape, strides, data, KeepAlive(artifact));
  array.attr("flags").attr("writeable") = false;
  return array;
}

template <typename T>
py::array_t<T> ColumnArray(const StridedSpan<T>& column, std::size_t stride,
                           const std::shared_ptr<const Artifact>& artifact) {
  const T* data = column.empty() ? nullptr : &column[0];
  return ArtifactArray<T>(data, {static_cast<py::ssize_t>(column.size())},
                          {static_cast<py::ssize_t>(stride * sizeof(T))}, artifact);
}

template <typename T>
py::array_t<T> MatrixArray(const MatrixView<T>& matrix, const std::shared_ptr<const Artifact>& artifact) {
  return ArtifactArray<T>(matrix.data().data(),
                          {static_cast<py::ssize_t>(matrix.rows()), static_cast<py::ssize_t>(matrix.cols())},
                          {static_cast<py::ssize_t>(matrix.cols() * sizeof(T)), static_cast<py::ssize_t>(sizeof(T))},
                          artifact);
}

struct PyPage {
  Page page;
  std::shared_ptr<const Artifact> artifact;
};

std::vector<float> ToFloatVector(const py::array_t<float, py::array::c_style | py::array::forcecast>& values) {
  return std::vector<float>(values.data(), values.data() + values.size());
}

}  // namespace

PYBIND11_MODULE(pylayoutprep, m) {
  py::enum_<LogLevel>(m, "LogLevel")
      .value("INFO", LogLevel::kInfo)
      .value("WARNING", LogLevel::kWarning)
      .value("ERROR", LogLevel::kError)
      .value("SILENT", LogLevel::kSilent);
  m.def("set_log_level", &SetLogLevel);

  py::class_<ModelSettings>(m, "ModelSettings")
      .def(py::init<>())
      .def_readwrite("max_page_number", &ModelSettings::max_page_number)
      .def_readwrite("font_hash_size", &ModelSettings::font_hash_size)
      .def_readwrite("minimum_token_frequency", &ModelSettings::minimum_token_frequency)
      .def_readwrite("glove_vectors", &ModelSettings::glove_vectors)
      .def("effective_page_count", &ModelSettings::EffectivePageCount)
      .def("featurizing_key", &FeaturizingKeyHex);

  py::class_<CorpusLayout>(m, "CorpusLayout")
      .def(py::init<>())
      .def_readwrite("token_dump", &CorpusLayout::token_dump)
      .def_readwrite("docs_dir", &CorpusLayout::docs_dir)
      .def_readwrite("vision_output", &CorpusLayout::vision_output);

  py::class_<Config>(m, "Config")
      .def(py::init<>())
      .def_readwrite("env_path", &Config::env_path)
      .def_readwrite("corpus_dir", &Config::corpus_dir)
      .def_readwrite("token_stats", &Config::token_stats)
      .def_readwrite("model", &Config::model)
      .def_readwrite("layout", &Config::layout)
      .def_readwrite("log_level", &Config::log_level)
      .def_static("from_env", [](const std::string& path) {
        Config cfg;
        cfg.env_path = path;
        ApplyEnvOverrides(cfg, ReadEnvFile(path));
        return cfg;
      });

  py::class_<TokenStatistics>(m, "TokenStatistics")
      .def(py::init<std::string>())
      .def("font_size_percentile", &TokenStatistics::FontSizePercentile)
      .def("space_width_percentile", &TokenStatistics::SpaceWidthPercentile)
      .def("font_size_percentiles",
           [](const TokenStatistics& self, const py::array_t<float, py::array::c_style | py::array::forcecast>& v) {
             auto out = self.FontSizePercentiles(ToFloatVector(v));
             return py::array_t<float>(static_cast<py::ssize_t>(out.size()), out.data());
           })
      .def("space_width_percentiles",
           [](const TokenStatistics& self, const py::array_t<float, py::array::c_style | py::array::forcecast>& v) {
             auto out = self.SpaceWidthPercentiles(ToFloatVector(v));
             return py::array_t<float>(static_cast<py::ssize_t>(out.size()), out.data());
           })
      .def("tokens_with_minimum_frequency", &TokenStatistics::TokensWithMinimumFrequency);

  py::class_<CombinedEmbeddings>(m, "CombinedEmbeddings")
      .def_property_readonly_static("OOV", [](py::object) { return std::string(CombinedEmbeddings::kOov); })
      .def_property_readonly_static("OOV_INDEX", [](py::object) { return CombinedEmbeddings::kOovIndex; })
      .def("index_for_token", &CombinedEmbeddings::IndexForToken)
      .def("dimensions", &CombinedEmbeddings::Dimensions)
      .def("vocab_size", &CombinedEmbeddings::VocabSize)
      .def("matrix", [](py::object self_obj) {
        const auto& self = self_obj.cast<const CombinedEmbeddings&>();
        const auto& matrix = self.Matrix();
        const auto cols = static_cast<py::ssize_t>(self.Dimensions());
        const auto rows = static_cast<py::ssize_t>(matrix.size()) / cols;
        py::array_t<float> array({rows, cols}, {cols * static_cast<py::ssize_t>(sizeof(float)),
                                               static_cast<py::ssize_t>(sizeof(float))},
                                 matrix.data(), self_obj);
        array.attr("flags").attr("writeable") = false;
        return array;
      });

  py::class_<PyPage>(m, "Page")
      .def_property_readonly("page_number", [](const PyPage& p) { return p.page.page_number; })
      .def_property_readonly("width", [](const PyPage& p) { return p.page.width; })
      .def_property_readonly("height", [](const PyPage& p) { return p.page.height; })
      .def_property_readonly("tokens", [](const PyPage& p) { return p.page.tokens.ToVector(); })
      .def_property_readonly("token_hashes",
                             [](const PyPage& p) {
                               return ColumnArray(p.page.token_hashes, kHashedTextFeatureCount, p.artifact);
                             })
      .def_property_readonly("font_hashes",
                             [](const PyPage& p) {
                               return ColumnArray(p.page.font_hashes, kHashedTextFeatureCount, p.artifact);
                             })
      .def_property_readonly("numeric_features",
                             [](const PyPage& p) { return MatrixArray(p.page.numeric_features, p.artifact); })
      .def_property_readonly("scaled_numeric_features",
                             [](const PyPage& p) { return MatrixArray(p.page.scaled_numeric_features, p.artifact); })
      .def_property_readonly("labels",
                             [](const PyPage& p) {
                               return ArtifactArray<std::int8_t>(
                                   p.page.labels.data(), {static_cast<py::ssize_t>(p.page.labels.size())},
                                   {static_cast<py::ssize_t>(sizeof(std::int8_t))}, p.artifact);
                             })
      .def("__repr__", [](const PyPage& p) { return "Page(" + std::to_string(p.page.page_number) + ", ...)"; });

  py::class_<Document>(m, "Document")
      .def_readonly("doc_id", &Document::doc_id)
      .def_readonly("doc_sha", &Document::doc_sha)
      .def_readonly("gold_title", &Document::gold_title)
      .def_property_readonly("gold_authors",
                             [](const Document& d) {
                               std::vector<std::pair<std::string, std::string>> out;
                               for (const auto& a : d.gold_authors) {
                                 out.emplace_back(a.given_names, a.surname);
                               }
                               return out;
                             })
      .def_property_readonly("pages",
                             [](const Document& d) {
                               std::vector<PyPage> pages;
                               for (const auto& page : d.pages) {
                                 pages.push_back(PyPage{page, d.artifact});
                               }
                               return pages;
                             })
      .def("__repr__", [](const Document& d) { return "Document('" + d.doc_id + "', ...)"; });

  py::class_<DocumentView>(m, "DocumentView")
      .def("__len__", &DocumentView::size)
      .def("__getitem__", [](const DocumentView& self, std::size_t i) {
        if (i >= self.size()) {
          throw py::index_error();
        }
        return self.Get(i);
      });

  py::class_<Pipeline>(m, "Pipeline")
      .def(py::init<Config>())
      .def_property_readonly("token_stats", &Pipeline::token_stats, py::return_value_policy::reference_internal)
      .def_property_readonly("embeddings", &Pipeline::embeddings, py::return_value_policy::reference_internal)
      .def("bucket_path", &Pipeline::BucketPath)
      .def("prepare_bucket",
           [](const Pipeline& self, const std::string& bucket) { return self.PrepareBucket(bucket)->path(); })
      .def("documents_for_bucket", &Pipeline::DocumentsForBucket)
      .def("documents", [](const Pipeline& self, bool test) {
        std::vector<Document> docs;
        self.ForEachDocument(test ? kTestBuckets : kTrainBuckets, [&](const Document& d) { docs.push_back(d); });
        return docs;
      }, py::arg("test") = false);

  m.def("bucket_name", &BucketName);
}

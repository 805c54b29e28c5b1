// sk_wrap/detail/tf_handle.hpp
// unique_ptr ownership of raw TensorFlow C API handles
//
// Each TF_New* has a matching TF_Delete*; TfDeleter binds the two so the
// wrappers in status.hpp, graph.hpp, session.hpp and tensor.hpp get move
// semantics and cleanup from std::unique_ptr instead of writing them out.

#pragma once

#include <memory>

extern "C" {
#include <tensorflow/c/c_api.h>
}

namespace sk_wrap::detail {

template<typename T, void (*Delete)(T*)>
struct TfDeleter {
    void operator()(T* p) const noexcept {
        if (p) Delete(p);
    }
};

template<typename T, void (*Delete)(T*)>
using TfHandle = std::unique_ptr<T, TfDeleter<T, Delete>>;

using RawTensorPtr = TfHandle<TF_Tensor, TF_DeleteTensor>;
using StatusPtr = TfHandle<TF_Status, TF_DeleteStatus>;
using BufferPtr = TfHandle<TF_Buffer, TF_DeleteBuffer>;
using SessionOptionsPtr = TfHandle<TF_SessionOptions, TF_DeleteSessionOptions>;
using ImportOptionsPtr = TfHandle<TF_ImportGraphDefOptions, TF_DeleteImportGraphDefOptions>;
using DeviceListPtr = TfHandle<TF_DeviceList, TF_DeleteDeviceList>;

/// Graphs are shared: a session keeps its graph alive.
using SharedGraph = std::shared_ptr<TF_Graph>;

[[nodiscard]] inline SharedGraph new_graph() {
    return SharedGraph(TF_NewGraph(), TfDeleter<TF_Graph, TF_DeleteGraph>{});
}

} // namespace sk_wrap::detail

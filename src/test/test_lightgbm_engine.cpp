#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "native/dataset_builder.hpp"
#include "native/lightgbm_engine.hpp"
#include "native/validate.hpp"

using namespace gbmbridge;

void test_dense_dataset() {
    LightGbmEngine engine;
    DenseRows rows;
    for (int r = 0; r < 64; ++r) rows.push_back({ (double)r, (double)(r % 7), 0.5 * r });

    DatasetHandle h = build_dense_dataset(engine, rows);
    assert(h != nullptr);
    assert(engine.num_data(h) == 64);
    assert(engine.num_feature(h) == 3);
    engine.free_dataset(h);

    std::cout << "lightgbm dense dataset tests passed!" << std::endl;
}

void test_csr_dataset() {
    LightGbmEngine engine;
    SparseRows rows;
    for (int r = 0; r < 64; ++r) {
        SparseRow row;
        row.size = 5;
        row.indices = { r % 5 };
        row.values = { 1.0 + r };
        rows.push_back(row);
    }

    DatasetHandle h = build_csr_dataset(engine, rows);
    assert(h != nullptr);
    assert(engine.num_data(h) == 64);
    assert(engine.num_feature(h) == 5);
    engine.free_dataset(h);

    std::cout << "lightgbm csr dataset tests passed!" << std::endl;
}

void test_failure_reports_engine_message() {
    LightGbmEngine engine;
    const double data[4] = { 1.0, 2.0, 3.0, 4.0 };
    DatasetSlot slot;
    bool threw = false;
    try {
        validate(engine.create_dataset_from_mat(data, kDtypeFloat64, 2, 2, 1, "max_bin=abc", nullptr, slot.out()),
            kDatasetCreateComponent, engine);
    }
    catch (const NativeCallError& e) {
        threw = true;
        assert(e.component() == kDatasetCreateComponent);
        assert(e.native_message().find("max_bin") != std::string::npos);
    }
    assert(threw);

    std::cout << "lightgbm failure tests passed!" << std::endl;
}

int main() {
    test_dense_dataset();
    test_csr_dataset();
    test_failure_reports_engine_message();
    return 0;
}

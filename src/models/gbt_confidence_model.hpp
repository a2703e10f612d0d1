#pragma once

#include "models/confidence_model.hpp"

#include <xgboost/c_api.h>

#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GbtConfidenceModel - XGBoost booster (binary:logistic) as a ConfidenceModel
//
// Inference only: the booster is trained elsewhere and loaded from disk.
// The model must have been trained on regime_features() columns in order.
// ---------------------------------------------------------------------------
class GbtConfidenceModel : public ConfidenceModel {
public:
    GbtConfidenceModel() : booster_(nullptr) {}

    explicit GbtConfidenceModel(const std::string& path) : booster_(nullptr) {
        load(path);
    }

    ~GbtConfidenceModel() override {
        if (booster_) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }
    }

    GbtConfidenceModel(const GbtConfidenceModel&) = delete;
    GbtConfidenceModel& operator=(const GbtConfidenceModel&) = delete;

    GbtConfidenceModel(GbtConfidenceModel&& other) noexcept : booster_(other.booster_) {
        other.booster_ = nullptr;
    }
    GbtConfidenceModel& operator=(GbtConfidenceModel&& other) noexcept {
        if (this != &other) {
            if (booster_) XGBoosterFree(booster_);
            booster_ = other.booster_;
            other.booster_ = nullptr;
        }
        return *this;
    }

    bool loaded() const { return booster_ != nullptr; }

    void load(const std::string& path) {
        if (booster_) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }

        check(XGBoosterCreate(nullptr, 0, &booster_));

        int rc = XGBoosterLoadModel(booster_, path.c_str());
        if (rc != 0) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
            throw std::runtime_error("Failed to load model from: " + path + " (" +
                                     XGBGetLastError() + ")");
        }
    }

    double predict_long_probability(const FeatureVector& features) override {
        return predict_long_probability(std::vector<FeatureVector>{features}).front();
    }

    std::vector<double> predict_long_probability(
            const std::vector<FeatureVector>& features) override {
        if (!booster_) {
            throw std::runtime_error("Model not loaded - call load() first");
        }
        if (features.empty()) return {};

        auto dmat = make_dmatrix(features);

        bst_ulong out_len = 0;
        const float* out_result = nullptr;
        check(XGBoosterPredict(booster_, dmat.handle, 0, 0, 0, &out_len, &out_result));

        if (out_len != static_cast<bst_ulong>(features.size())) {
            throw std::runtime_error("Expected one probability per row, got " +
                                     std::to_string(out_len) + " values for " +
                                     std::to_string(features.size()) + " rows");
        }

        std::vector<double> probs(features.size());
        for (size_t i = 0; i < features.size(); ++i) {
            probs[i] = static_cast<double>(out_result[i]);
        }
        return probs;
    }

private:
    BoosterHandle booster_;

    // RAII guard for DMatrixHandle
    struct DMatrixGuard {
        DMatrixHandle handle = nullptr;
        explicit DMatrixGuard(DMatrixHandle h) : handle(h) {}
        ~DMatrixGuard() { if (handle) XGDMatrixFree(handle); }
        DMatrixGuard(const DMatrixGuard&) = delete;
        DMatrixGuard& operator=(const DMatrixGuard&) = delete;
    };

    static DMatrixGuard make_dmatrix(const std::vector<FeatureVector>& features) {
        bst_ulong n = static_cast<bst_ulong>(features.size());
        std::vector<float> flat(features.size() * REGIME_FEATURE_DIM);
        for (size_t i = 0; i < features.size(); ++i) {
            std::memcpy(&flat[i * REGIME_FEATURE_DIM], features[i].data(),
                        REGIME_FEATURE_DIM * sizeof(float));
        }
        DMatrixHandle dmat;
        check(XGDMatrixCreateFromMat(flat.data(), n, REGIME_FEATURE_DIM,
                                     std::numeric_limits<float>::quiet_NaN(), &dmat));
        return DMatrixGuard(dmat);
    }

    static void check(int rc) {
        if (rc != 0) {
            throw std::runtime_error(std::string("XGBoost error: ") + XGBGetLastError());
        }
    }
};

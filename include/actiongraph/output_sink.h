#pragma once

#include "error.h"
#include <google/protobuf/repeated_ptr_field.h>
#include <cstddef>
#include <string>
#include <utility>

namespace actiongraph {

/// Append-only destination for materialized values of one section.
/// Iteration order of the final output equals append order.
template <typename V>
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual void append(V value) = 0;
    virtual size_t count() const = 0;
};

/// Sink backed by a repeated field of the output container. The field must
/// outlive the sink. After seal() every append throws OutputError.
template <typename V>
class RepeatedFieldSink : public OutputSink<V> {
public:
    RepeatedFieldSink(std::string section, google::protobuf::RepeatedPtrField<V>* field)
        : section_(std::move(section)), field_(field) {}

    void append(V value) override {
        if (sealed_) {
            throw OutputError("section '" + section_ + "' is sealed");
        }
        *field_->Add() = std::move(value);
    }

    size_t count() const override { return static_cast<size_t>(field_->size()); }

    void seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }
    const std::string& section() const { return section_; }

private:
    std::string section_;
    google::protobuf::RepeatedPtrField<V>* field_;
    bool sealed_ = false;
};

} // namespace actiongraph

#include "msgpk/codable.hpp"

#include <algorithm>

namespace msgpk {

namespace detail {

// ------------------------------
// Boxes
// ------------------------------

void ArrayBox::append(BoxPtr b) {
    items_.push_back(std::move(b));
}

void ArrayBox::insert(std::size_t index, BoxPtr b) {
    const std::size_t at = std::min(index, items_.size());
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(at), std::move(b));
}

Value ArrayBox::materialize() const {
    Value::Array out;
    out.reserve(items_.size());
    for (const auto& item : items_) {
        out.push_back(item->materialize());
    }
    return Value::make_array(std::move(out));
}

void MapBox::set(const std::string& key, BoxPtr b) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(b);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, std::move(b));
}

Value MapBox::materialize() const {
    Value::Map out;
    for (const auto& [key, box] : entries_) {
        out.insert_or_assign(Value::make_string(key), box->materialize());
    }
    return Value::make_map(std::move(out));
}

const Value& nil_value() {
    static const Value nil = Value::make_nil();
    return nil;
}

void throw_type_mismatch(const char* expected, const Value& found, const char* detail) {
    std::string msg = std::string("expected ") + expected + " but found " + to_string(found.kind());
    if (detail) {
        msg += " (";
        msg += detail;
        msg += ")";
    }
    throw MsgpkError(ErrorKind::TypeMismatch, msg);
}

} // namespace detail

// ------------------------------
// Encoder
// ------------------------------

Encoder::Encoder(EncoderOptions options, CodingPath path)
    : options_(options), path_(std::move(path)) {}

Encoder::~Encoder() = default;

void Encoder::misuse(const std::string& msg) const {
    throw MsgpkError(ErrorKind::InvalidArgument, msg, path_);
}

detail::BoxPtr Encoder::result_box() const {
    if (storage_.empty()) return std::make_shared<detail::MapBox>();
    return storage_.back();
}

KeyedEncodingContainer Encoder::keyed_container() {
    if (can_encode_new_value()) {
        auto box = std::make_shared<detail::MapBox>();
        storage_.push_back(box);
        return KeyedEncodingContainer(*this, std::move(box), path_);
    }
    auto top = std::dynamic_pointer_cast<detail::MapBox>(storage_.back());
    if (!top) {
        misuse("cannot push a keyed container where a different value was already encoded");
    }
    return KeyedEncodingContainer(*this, std::move(top), path_);
}

UnkeyedEncodingContainer Encoder::unkeyed_container() {
    if (can_encode_new_value()) {
        auto box = std::make_shared<detail::ArrayBox>();
        storage_.push_back(box);
        return UnkeyedEncodingContainer(*this, std::move(box), path_);
    }
    auto top = std::dynamic_pointer_cast<detail::ArrayBox>(storage_.back());
    if (!top) {
        misuse("cannot push an unkeyed container where a different value was already encoded");
    }
    return UnkeyedEncodingContainer(*this, std::move(top), path_);
}

SingleValueEncodingContainer Encoder::single_value_container() {
    return SingleValueEncodingContainer(*this);
}

void SingleValueEncodingContainer::encode_nil() {
    if (!encoder_->can_encode_new_value()) {
        encoder_->misuse("single value container already holds a value");
    }
    encoder_->storage_.push_back(std::make_shared<detail::ValueBox>(Value::make_nil()));
}

// ------------------------------
// Keyed encoding
// ------------------------------

KeyedEncodingContainer::KeyedEncodingContainer(Encoder& encoder, std::shared_ptr<detail::MapBox> box, CodingPath path)
    : encoder_(&encoder), box_(std::move(box)), path_(std::move(path)) {}

void KeyedEncodingContainer::encode_nil(const std::string& key) {
    box_->set(key, std::make_shared<detail::ValueBox>(Value::make_nil()));
}

KeyedEncodingContainer KeyedEncodingContainer::nested_container(const std::string& key) {
    auto box = std::make_shared<detail::MapBox>();
    box_->set(key, box);
    return KeyedEncodingContainer(*encoder_, std::move(box), detail::appended(path_, CodingKey::named(key)));
}

UnkeyedEncodingContainer KeyedEncodingContainer::nested_unkeyed_container(const std::string& key) {
    auto box = std::make_shared<detail::ArrayBox>();
    box_->set(key, box);
    return UnkeyedEncodingContainer(*encoder_, std::move(box), detail::appended(path_, CodingKey::named(key)));
}

std::unique_ptr<ReferencingEncoder> KeyedEncodingContainer::super_encoder() {
    return super_encoder(CodingKey::super_key().name);
}

std::unique_ptr<ReferencingEncoder> KeyedEncodingContainer::super_encoder(const std::string& key) {
    return std::make_unique<ReferencingEncoder>(
        encoder_->options(), detail::appended(path_, CodingKey::named(key)), box_, key);
}

// ------------------------------
// Unkeyed encoding
// ------------------------------

UnkeyedEncodingContainer::UnkeyedEncodingContainer(Encoder& encoder, std::shared_ptr<detail::ArrayBox> box, CodingPath path)
    : encoder_(&encoder), box_(std::move(box)), path_(std::move(path)) {}

void UnkeyedEncodingContainer::encode_nil() {
    box_->append(std::make_shared<detail::ValueBox>(Value::make_nil()));
}

KeyedEncodingContainer UnkeyedEncodingContainer::nested_container() {
    CodingPath path = detail::appended(path_, CodingKey::indexed(box_->size()));
    auto box = std::make_shared<detail::MapBox>();
    box_->append(box);
    return KeyedEncodingContainer(*encoder_, std::move(box), std::move(path));
}

UnkeyedEncodingContainer UnkeyedEncodingContainer::nested_unkeyed_container() {
    CodingPath path = detail::appended(path_, CodingKey::indexed(box_->size()));
    auto box = std::make_shared<detail::ArrayBox>();
    box_->append(box);
    return UnkeyedEncodingContainer(*encoder_, std::move(box), std::move(path));
}

std::unique_ptr<ReferencingEncoder> UnkeyedEncodingContainer::super_encoder() {
    const std::size_t index = box_->size();
    return std::make_unique<ReferencingEncoder>(
        encoder_->options(), detail::appended(path_, CodingKey::indexed(index)), box_, index);
}

// ------------------------------
// Referencing encoder
// ------------------------------

ReferencingEncoder::ReferencingEncoder(const EncoderOptions& options, CodingPath path,
                                       std::shared_ptr<detail::MapBox> target, std::string key)
    : Encoder(options, std::move(path)), map_target_(std::move(target)), key_(std::move(key)) {}

ReferencingEncoder::ReferencingEncoder(const EncoderOptions& options, CodingPath path,
                                       std::shared_ptr<detail::ArrayBox> target, std::size_t index)
    : Encoder(options, std::move(path)), array_target_(std::move(target)), index_(index) {}

ReferencingEncoder::~ReferencingEncoder() {
    finalize();
}

void ReferencingEncoder::finalize() {
    if (finalized_) return;
    finalized_ = true;

    detail::BoxPtr b = result_box();
    if (map_target_) {
        map_target_->set(key_, std::move(b));
    } else {
        array_target_->insert(index_, std::move(b));
    }
}

// ------------------------------
// Decoder
// ------------------------------

Decoder::Decoder(const Value& root, DecoderOptions options, CodingPath path)
    : options_(options), path_(std::move(path)) {
    storage_.push_back(&root);
}

KeyedDecodingContainer Decoder::keyed_container() {
    return keyed_container_for(top(), path_);
}

UnkeyedDecodingContainer Decoder::unkeyed_container() {
    return unkeyed_container_for(top(), path_);
}

SingleValueDecodingContainer Decoder::single_value_container() {
    return SingleValueDecodingContainer(*this);
}

KeyedDecodingContainer Decoder::keyed_container_for(const Value& value, const CodingPath& path) {
    if (value.is_nil()) {
        throw MsgpkError(ErrorKind::ValueNotFound, "cannot get keyed decoding container, found nil instead", path);
    }
    if (!value.is_map()) {
        throw MsgpkError(ErrorKind::TypeMismatch,
                         "expected map but found " + to_string(value.kind()), path);
    }

    std::map<std::string, const Value*> entries;
    for (const auto& [k, v] : value.as_map()) {
        if (const auto* s = std::get_if<std::string>(&k.v)) {
            entries.insert_or_assign(*s, &v);
            continue;
        }
        if (const auto* b = std::get_if<Bytes>(&k.v)) {
            if (is_valid_utf8(b->data(), b->size())) {
                entries.insert_or_assign(std::string(b->begin(), b->end()), &v);
                continue;
            }
        }
        throw MsgpkError(ErrorKind::TypeMismatch,
                         "map key of kind " + to_string(k.kind()) + " is not a string", path);
    }
    return KeyedDecodingContainer(*this, std::move(entries), path);
}

UnkeyedDecodingContainer Decoder::unkeyed_container_for(const Value& value, const CodingPath& path) {
    if (value.is_nil()) {
        throw MsgpkError(ErrorKind::ValueNotFound, "cannot get unkeyed decoding container, found nil instead", path);
    }
    if (!value.is_array()) {
        throw MsgpkError(ErrorKind::TypeMismatch,
                         "expected array but found " + to_string(value.kind()), path);
    }
    return UnkeyedDecodingContainer(*this, value.as_array(), path);
}

// ------------------------------
// Keyed decoding
// ------------------------------

KeyedDecodingContainer::KeyedDecodingContainer(Decoder& decoder, std::map<std::string, const Value*> entries, CodingPath path)
    : decoder_(&decoder), entries_(std::move(entries)), path_(std::move(path)) {}

const Value& KeyedDecodingContainer::entry(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw MsgpkError(ErrorKind::KeyNotFound, "no value associated with key \"" + key + "\"",
                         detail::appended(path_, CodingKey::named(key)));
    }
    return *it->second;
}

std::vector<std::string> KeyedDecodingContainer::all_keys() const {
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& kv : entries_) {
        keys.push_back(kv.first);
    }
    return keys;
}

bool KeyedDecodingContainer::contains(const std::string& key) const {
    return entries_.count(key) != 0;
}

bool KeyedDecodingContainer::decode_nil(const std::string& key) const {
    return entry(key).is_nil();
}

KeyedDecodingContainer KeyedDecodingContainer::nested_container(const std::string& key) const {
    const Value& v = entry(key);
    return decoder_->keyed_container_for(v, detail::appended(path_, CodingKey::named(key)));
}

UnkeyedDecodingContainer KeyedDecodingContainer::nested_unkeyed_container(const std::string& key) const {
    const Value& v = entry(key);
    return decoder_->unkeyed_container_for(v, detail::appended(path_, CodingKey::named(key)));
}

Decoder KeyedDecodingContainer::super_decoder() const {
    return super_decoder(CodingKey::super_key().name);
}

Decoder KeyedDecodingContainer::super_decoder(const std::string& key) const {
    auto it = entries_.find(key);
    const Value& v = it == entries_.end() ? detail::nil_value() : *it->second;
    return Decoder(v, decoder_->options(), detail::appended(path_, CodingKey::named(key)));
}

// ------------------------------
// Unkeyed decoding
// ------------------------------

UnkeyedDecodingContainer::UnkeyedDecodingContainer(Decoder& decoder, const Value::Array& array, CodingPath path)
    : decoder_(&decoder), array_(&array), path_(std::move(path)) {}

const Value& UnkeyedDecodingContainer::current(const char* what) const {
    if (is_at_end()) {
        throw MsgpkError(ErrorKind::ValueNotFound,
                         std::string("unkeyed container is at end, cannot decode ") + what,
                         detail::appended(path_, CodingKey::indexed(index_)));
    }
    return (*array_)[index_];
}

bool UnkeyedDecodingContainer::decode_nil() {
    if (!current("nil").is_nil()) return false;
    ++index_;
    return true;
}

KeyedDecodingContainer UnkeyedDecodingContainer::nested_container() {
    const Value& v = current("nested keyed container");
    KeyedDecodingContainer out = decoder_->keyed_container_for(v, detail::appended(path_, CodingKey::indexed(index_)));
    ++index_;
    return out;
}

UnkeyedDecodingContainer UnkeyedDecodingContainer::nested_unkeyed_container() {
    const Value& v = current("nested unkeyed container");
    UnkeyedDecodingContainer out = decoder_->unkeyed_container_for(v, detail::appended(path_, CodingKey::indexed(index_)));
    ++index_;
    return out;
}

Decoder UnkeyedDecodingContainer::super_decoder() {
    const Value& v = current("super decoder");
    Decoder out(v, decoder_->options(), detail::appended(path_, CodingKey::indexed(index_)));
    ++index_;
    return out;
}

} // namespace msgpk

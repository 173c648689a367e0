#include <cbors.hpp>

#include <bitsery/adapter/buffer.h>
#include <bitsery/deserializer.h>
#include <bitsery/serializer.h>
#include <bitsery/traits/vector.h>

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

struct Envelope {
  std::uint32_t id{};
  cbors::value body;
};

template <typename S>
void serialize(S& s, Envelope& e) {
  s.value4b(e.id);
  s.object(e.body);
}

namespace {

using Buffer = std::vector<std::uint8_t>;
using Output = bitsery::OutputBufferAdapter<Buffer>;
using Input = bitsery::InputBufferAdapter<Buffer>;

}  // namespace

int main() {
  {
    cbors::value v = cbors::value::map({{cbors::value::text("a"), cbors::value::boolean(false)}});
    Buffer blob;
    const std::size_t written = bitsery::quickSerialization(Output(blob), v);
    blob.resize(written);
    assert(blob == (Buffer{0x04, 0xA1, 0x61, 'a', 0xF4}));

    cbors::value back;
    const auto [read_error, completed] = bitsery::quickDeserialization(Input(blob.begin(), blob.end()), back);
    assert(read_error == bitsery::ReaderError::NoError);
    assert(completed);
    assert(back == v);

    Buffer tampered = blob;
    tampered[1] = 0x1C;
    cbors::value rejected = cbors::value::integer(1);
    const auto [tampered_error, tampered_completed] =
        bitsery::quickDeserialization(Input(tampered.begin(), tampered.end()), rejected);
    assert(tampered_error == bitsery::ReaderError::InvalidData);
    assert(!tampered_completed);
    assert(rejected.is_null());

    // A payload holding more than one item is rejected too.
    Buffer trailing{0x02, 0x01, 0x02};
    cbors::value two_items;
    const auto [trailing_error, trailing_completed] =
        bitsery::quickDeserialization(Input(trailing.begin(), trailing.end()), two_items);
    assert(trailing_error == bitsery::ReaderError::InvalidData);
    assert(!trailing_completed);

    Buffer short_blob{0x10, 0xA1};
    cbors::value cut;
    const auto [short_error, short_completed] =
        bitsery::quickDeserialization(Input(short_blob.begin(), short_blob.end()), cut);
    assert(short_error != bitsery::ReaderError::NoError);
    assert(!short_completed);
  }

  {
    Envelope src;
    src.id = 42;
    src.body = cbors::value::array({cbors::value::text(std::string(200, 'z')), cbors::value::integer(-7)});

    Buffer blob;
    const std::size_t written = bitsery::quickSerialization(Output(blob), src);
    blob.resize(written);
    // 4-byte id, 2-byte size prefix, then the CBOR item.
    assert(blob[4] == 0x80);
    assert(blob[6] == 0x82);

    Envelope dst;
    const auto [read_error, completed] = bitsery::quickDeserialization(Input(blob.begin(), blob.end()), dst);
    assert(read_error == bitsery::ReaderError::NoError);
    assert(completed);
    assert(dst.id == 42);
    assert(dst.body == src.body);
  }

  {
    cbors::value empty;
    Buffer blob;
    const std::size_t written = bitsery::quickSerialization(Output(blob), empty);
    blob.resize(written);
    assert(blob == (Buffer{0x01, 0xF6}));

    cbors::value back = cbors::value::integer(3);
    const auto [read_error, completed] = bitsery::quickDeserialization(Input(blob.begin(), blob.end()), back);
    assert(read_error == bitsery::ReaderError::NoError);
    assert(completed);
    assert(back.is_null());
  }

  return 0;
}

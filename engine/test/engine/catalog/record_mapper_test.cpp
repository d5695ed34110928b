#include "catalog/record_mapper.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "catalog/definition_registry.hpp"

using namespace vecschema;
using namespace vecschema::engine::meta;

namespace {

struct Article {
  std::string id;
  std::string content;
  std::vector<float> embedding;
  int scratch = 7;

  static RecordDescriptor<Article> DescribeFields() {
    return RecordDescriptor<Article>("Article")
        .Field("id", &Article::id, {"key", {{"type", "text"}}})
        .Field("content", &Article::content, {"data", {{"isFullTextIndexed", "true"}}})
        .Field("embedding", &Article::embedding, {"vector", {{"name", "vector"}, {"dimensions", "2"}}})
        .Field("scratch", &Article::scratch);
  }
};

struct Note {
  static std::atomic<int> tag_factory_calls;

  int64_t id = 0;
  std::string title;
  double score = 0.0;
  Json tags;
  std::optional<std::string> summary;
  std::variant<std::vector<float>, std::string> embedding;

  static RecordDescriptor<Note> DescribeFields() {
    return RecordDescriptor<Note>("Note")
        .Field("id", &Note::id, {"key"})
        .FieldWithDefault("title", &Note::title, {"data"}, std::string("untitled"))
        .FieldWithDefault("score", &Note::score, {"data", {{"isFilterable", "true"}}}, 1.5)
        .Field("tags", &Note::tags, {"data"},
               []() {
                 tag_factory_calls.fetch_add(1);
                 return Json::MakeArray();
               })
        .Field("summary", &Note::summary, {"data"})
        .Field("embedding", &Note::embedding, {"vector", {{"name", "vector"}, {"dimensions", "3"}}});
  }
};

std::atomic<int> Note::tag_factory_calls{0};

struct Fragile {
  int64_t id = 0;
  Json tags;
  std::vector<float> embedding;

  static RecordDescriptor<Fragile> DescribeFields() {
    return RecordDescriptor<Fragile>("Fragile")
        .Field("id", &Fragile::id, {"key"})
        .Field("tags", &Fragile::tags, {"data"}, []() -> Json { throw std::runtime_error("tag service down"); })
        .Field("embedding", &Fragile::embedding, {"vector", {{"dimensions", "2"}}});
  }
};

struct Generated {
  static std::atomic<int> id_factory_calls;

  std::string id;
  std::string content;
  std::vector<float> embedding;

  static RecordDescriptor<Generated> DescribeFields() {
    return RecordDescriptor<Generated>("Generated")
        .Field("id", &Generated::id, {"key"},
               []() { return "generated-" + std::to_string(id_factory_calls.fetch_add(1) + 1); })
        .Field("content", &Generated::content, {"data"})
        .Field("embedding", &Generated::embedding, {"vector", {{"dimensions", "2"}}});
  }
};

std::atomic<int> Generated::id_factory_calls{0};

struct Opaque {
  int64_t id = 0;
  Json tags;
  std::vector<float> embedding;

  static RecordDescriptor<Opaque> DescribeFields() {
    return RecordDescriptor<Opaque>("Opaque")
        .Field("id", &Opaque::id, {"key"})
        .Field("tags", &Opaque::tags, {"data"}, []() -> Json { throw 42; })
        .Field("embedding", &Opaque::embedding, {"vector", {{"dimensions", "2"}}});
  }
};

Json ParseRow(const std::string& text) {
  Json row;
  EXPECT_TRUE(row.LoadFromString(text)) << text;
  return row;
}

}  // namespace

class RecordMapperTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Note::tag_factory_calls.store(0);
    Generated::id_factory_calls.store(0);
  }

  template <typename Record>
  CollectionDefinitionPtr Definition() {
    CollectionDefinitionPtr definition;
    auto status = registry_.Get<Record>(definition);
    EXPECT_TRUE(status.ok()) << status.ToString();
    return definition;
  }

  DefinitionRegistry registry_;
};

TEST_F(RecordMapperTest, SerializesInDefinitionOrder) {
  RecordMapper<Article> mapper(Definition<Article>());
  ASSERT_TRUE(mapper.status().ok()) << mapper.status().ToString();

  Article article;
  article.id = "a-1";
  article.content = "hello";
  article.embedding = {0.5f, 0.25f};
  article.scratch = 99;

  Json row;
  ASSERT_TRUE(mapper.SerializeRecord(article, row).ok());
  EXPECT_EQ(row, ParseRow(R"({"id":"a-1","content":"hello","vector":[0.5,0.25]})"));
  EXPECT_FALSE(row.HasMember("scratch"));
}

TEST_F(RecordMapperTest, DeserializesByStorageName) {
  RecordMapper<Article> mapper(Definition<Article>());

  Article article;
  auto status = mapper.DeserializeRecord(ParseRow(R"({"id":"a-2","content":"text","vector":[1,2]})"), 0, article);
  ASSERT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(article.id, "a-2");
  EXPECT_EQ(article.content, "text");
  ASSERT_EQ(article.embedding.size(), 2u);
  EXPECT_FLOAT_EQ(article.embedding[1], 2.0f);
  // Members outside the schema keep their initializer
  EXPECT_EQ(article.scratch, 7);

  status = mapper.DeserializeRecord(ParseRow(R"({"id":"a-3","embedding":[1,2]})"), 0, article);
  EXPECT_EQ(status.code(), SERIALIZATION_ERROR);
  EXPECT_EQ(status.message(), "Row 0: unknown field 'embedding'.");
  // Untouched on failure
  EXPECT_EQ(article.id, "a-2");
}

TEST_F(RecordMapperTest, RequiresKeyField) {
  RecordMapper<Article> mapper(Definition<Article>());
  Article article;
  auto status = mapper.DeserializeRecord(ParseRow(R"({"content":"text"})"), 3, article);
  EXPECT_EQ(status.code(), SERIALIZATION_ERROR);
  EXPECT_EQ(status.message(), "Row 3: missing key field 'id'.");
}

TEST_F(RecordMapperTest, KeyFactorySuppliesOmittedKey) {
  RecordMapper<Generated> mapper(Definition<Generated>());
  ASSERT_TRUE(mapper.status().ok()) << mapper.status().ToString();

  std::vector<Generated> records;
  auto status = mapper.Deserialize({ParseRow(R"({"content":"hello"})"), ParseRow(R"({"content":"hello"})")}, records);
  ASSERT_TRUE(status.ok()) << status.ToString();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].id, "generated-1");
  EXPECT_EQ(records[1].id, "generated-2");
  EXPECT_NE(records[0].id, records[1].id);

  // A key present in the row wins over the factory
  Generated record;
  status = mapper.DeserializeRecord(ParseRow(R"({"id":"given","content":"x"})"), 0, record);
  ASSERT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(record.id, "given");
  EXPECT_EQ(Generated::id_factory_calls.load(), 2);
}

TEST_F(RecordMapperTest, RejectsMismatchedValueTypes) {
  RecordMapper<Note> mapper(Definition<Note>());
  Note note;
  auto status = mapper.DeserializeRecord(ParseRow(R"({"id":"one"})"), 0, note);
  EXPECT_EQ(status.code(), SERIALIZATION_ERROR);
  EXPECT_EQ(status.message(), "Row 0: value of field 'id' does not match type BIGINT.");

  status = mapper.DeserializeRecord(ParseRow(R"({"id":1,"vector":[1,"two",3]})"), 0, note);
  EXPECT_EQ(status.code(), SERIALIZATION_ERROR);
}

TEST_F(RecordMapperTest, AppliesDefaultsPerRecord) {
  RecordMapper<Note> mapper(Definition<Note>());
  ASSERT_TRUE(mapper.status().ok()) << mapper.status().ToString();

  std::vector<Note> notes;
  auto status = mapper.Deserialize({ParseRow(R"({"id":1})"), ParseRow(R"({"id":2,"title":"kept"})")}, notes);
  ASSERT_TRUE(status.ok()) << status.ToString();
  ASSERT_EQ(notes.size(), 2u);

  EXPECT_EQ(notes[0].title, "untitled");
  EXPECT_EQ(notes[1].title, "kept");
  EXPECT_DOUBLE_EQ(notes[0].score, 1.5);
  EXPECT_TRUE(notes[0].tags.IsArray());
  EXPECT_FALSE(notes[0].summary.has_value());
  // One factory run per constructed record
  EXPECT_EQ(Note::tag_factory_calls.load(), 2);

  notes[0].tags.AddStringToArray("mutated");
  EXPECT_EQ(notes[1].tags.GetSize(), 0u);
}

TEST_F(RecordMapperTest, ExplicitValuesSkipDefaults) {
  RecordMapper<Note> mapper(Definition<Note>());
  Note note;
  auto status = mapper.DeserializeRecord(
      ParseRow(R"({"id":5,"title":"t","score":2,"tags":["x"],"summary":"s","vector":"embed me later"})"), 0, note);
  ASSERT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(Note::tag_factory_calls.load(), 0);
  EXPECT_DOUBLE_EQ(note.score, 2.0);
  EXPECT_EQ(note.tags.GetArrayElement(0).GetString(), "x");
  ASSERT_TRUE(note.summary.has_value());
  EXPECT_EQ(*note.summary, "s");
  ASSERT_TRUE(std::holds_alternative<std::string>(note.embedding));
  EXPECT_EQ(std::get<std::string>(note.embedding), "embed me later");

  status = mapper.DeserializeRecord(ParseRow(R"({"id":5,"summary":null,"vector":[0.5,1,2]})"), 0, note);
  ASSERT_TRUE(status.ok()) << status.ToString();
  EXPECT_FALSE(note.summary.has_value());
  ASSERT_TRUE(std::holds_alternative<std::vector<float>>(note.embedding));
  EXPECT_EQ(std::get<std::vector<float>>(note.embedding).size(), 3u);
}

TEST_F(RecordMapperTest, VectorOrTextIsStoredAsIs) {
  RecordMapper<Note> mapper(Definition<Note>());
  Note note;
  note.id = 9;
  note.title = "t";
  note.tags = Json::MakeArray();
  note.embedding = std::string("source text");

  Json row;
  ASSERT_TRUE(mapper.SerializeRecord(note, row).ok());
  EXPECT_EQ(row.GetString("vector"), "source text");
  EXPECT_TRUE(row.Get("summary").IsNull());
  std::vector<std::string> keys = {"id", "title", "score", "tags", "summary", "vector"};
  EXPECT_EQ(row.GetKeys(), keys);

  note.embedding = std::vector<float>{1.0f, 2.0f, 3.0f};
  ASSERT_TRUE(mapper.SerializeRecord(note, row).ok());
  EXPECT_TRUE(row.Get("vector").IsArray());
  EXPECT_EQ(row.GetArraySize("vector"), 3u);
}

TEST_F(RecordMapperTest, FactoryFailuresBecomeSerializationErrors) {
  RecordMapper<Fragile> mapper(Definition<Fragile>());
  Fragile record;
  auto status = mapper.DeserializeRecord(ParseRow(R"({"id":1})"), 2, record);
  EXPECT_EQ(status.code(), SERIALIZATION_ERROR);
  EXPECT_EQ(status.message(), "Row 2: default factory of 'tags' failed: tag service down");

  EXPECT_TRUE(mapper.DeserializeRecord(ParseRow(R"({"id":1,"tags":[]})"), 2, record).ok());
}

TEST_F(RecordMapperTest, NonStandardFactoryExceptionsBecomeSerializationErrors) {
  RecordMapper<Opaque> mapper(Definition<Opaque>());
  Opaque record;
  auto status = mapper.DeserializeRecord(ParseRow(R"({"id":1})"), 4, record);
  EXPECT_EQ(status.code(), SERIALIZATION_ERROR);
  EXPECT_EQ(status.message(), "Row 4: default factory of 'tags' failed: unknown exception");
}

TEST_F(RecordMapperTest, BatchReportsRowIndex) {
  RecordMapper<Article> mapper(Definition<Article>());
  std::vector<Article> articles;
  auto status = mapper.Deserialize({ParseRow(R"({"id":"1"})"), ParseRow(R"({"content":"x"})")}, articles);
  EXPECT_EQ(status.code(), SERIALIZATION_ERROR);
  EXPECT_EQ(status.message(), "Row 1: missing key field 'id'.");
  EXPECT_TRUE(articles.empty());

  Article first;
  first.id = "1";
  Article second;
  second.id = "2";
  std::vector<Json> rows;
  ASSERT_TRUE(mapper.Serialize({first, second}, rows).ok());
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1].GetString("id"), "2");
}

TEST_F(RecordMapperTest, RejectsForeignDefinition) {
  RecordMapper<Note> mapper(Definition<Article>());
  EXPECT_EQ(mapper.status().code(), SERIALIZATION_ERROR);
  EXPECT_NE(mapper.status().message().find("'content'"), std::string::npos);

  Note note;
  Json row;
  EXPECT_EQ(mapper.SerializeRecord(note, row).code(), SERIALIZATION_ERROR);

  RecordMapper<Note> unbound(nullptr);
  EXPECT_EQ(unbound.status().code(), UNEXPECTED_ERROR);
}

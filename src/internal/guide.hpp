#pragma once

#include <string_view>

namespace imagen::internal {

    using namespace std::string_view_literals;

    // sent once as the `instructions` field of the initialize result
    inline constexpr auto usage_guide =
            R"(Use the generate_image tool to create images from text descriptions. The returned URL can be used in markdown format like ![description](URL) to display the image.

Before generating an image, please read the <Imagen_prompt_guide> section to understand how to create effective prompts.

<Imagen_prompt_guide>
## Prompt writing basics
Describe the image to generate. Maximum prompt length is 480 tokens. A good prompt is descriptive and clear, and uses meaningful keywords and modifiers. Start by thinking of your subject, context, and style.
Example Prompt: A sketch (style) of a modern apartment building (subject) surrounded by skyscrapers (context and background).
1. Subject: the object, person, animal, or scenery you want an image of.
2. Context and background: where the subject is placed, for example a studio with a white background, outdoors, or an indoor environment.
3. Style: general (painting, photograph, sketch) or specific (pastel painting, charcoal drawing, isometric 3D). Styles can be combined.
Refine the first version of a prompt by adding details until the image is close to your vision. Iteration is important.
Example Prompt: close-up photo of a woman in her 20s, street photography, movie still, muted orange warm tones
Additional advice:
- Use descriptive language: detailed adjectives and adverbs paint a clear picture.
- Provide context: include background information when it helps.
- Reference specific artists or styles when you have a particular aesthetic in mind.
- For faces, make facial details the focus of the photo (for example, use the word "portrait").
## Generate text in images
- Iterate with confidence: text rendering may need several attempts.
- Keep it short: limit text to 25 characters or less.
- Multiple phrases: use two or three distinct phrases at most.
Example Prompt: A poster with the text "Summerland" in bold font as a title, underneath this text is the slogan "Summer never felt so good"
- Guide placement and font style loosely; expect creative interpretations.
- Font size: give a size or a general indication (small, medium, large).
## Advanced prompt writing techniques
### Photography
Start prompts with "A photo of..." to ask for a photograph.
Example Prompt: A photo of coffee beans in a kitchen on a wooden surface
#### Photography modifiers
1. Camera proximity - close up, taken from far away
   Example Prompt: A close-up photo of coffee beans
2. Camera position - aerial, from below
   Example Prompt: aerial photo of urban city with skyscrapers
3. Lighting - natural, dramatic, warm, cold
   Example Prompt: studio photo of a modern arm chair, dramatic lighting
4. Camera settings - motion blur, soft focus, bokeh, portrait
   Example Prompt: soft focus photograph of a bridge in an urban city at night
5. Lens types - 35mm, 50mm, fisheye, wide angle, macro
   Example Prompt: photo of a leaf, macro lens
6. Film types - black and white, polaroid
   Example Prompt: a polaroid portrait of a dog wearing sunglasses
### Illustration and art
Prompts like "A painting of..." or "A sketch of..." select an art style.
Example Prompt: A technical pencil drawing of an angular sporty electric sedan with skyscrapers in the background
Example Prompt: An art deco poster of an angular sporty electric sedan with skyscrapers in the background
#### Shapes and materials
Prompts like "...made of..." or "...in the shape of...".
Example Prompt: a duffle bag made of cheese
Example Prompt: neon tubes in the shape of a bird
#### Historical art references
Prompts like "...in the style of...".
Example Prompt: generate an image in the style of an impressionist painting: a wind farm
### Image quality modifiers
- General: high-quality, beautiful, stylized
- Photos: 4K, HDR, Studio Photo
- Art, Illustration: by a professional, detailed
Example Prompt: 4k HDR beautiful photo of a corn stalk taken by a professional photographer
### Aspect ratios
Square (1:1, default), fullscreen (4:3), portrait full screen (3:4), widescreen (16:9) and portrait (9:16).
Example Prompt: a man wearing all white clothing sitting on the beach, close up, golden hour lighting (16:9 aspect ratio)
### Photorealistic images
| Use case | Lens type | Focal lengths | Additional details |
| --- | --- | --- | --- |
| People (portraits) | Prime, zoom | 24-35mm | black and white film, Film noir, Depth of field, duotone (mention two colors) |
| Food, insects, plants (objects, still life) | Macro | 60-105mm | High detail, precise focusing, controlled lighting |
| Sports, wildlife (motion) | Telephoto zoom | 100-400mm | Fast shutter speed, Action or movement tracking |
| Astronomical, landscape (wide-angle) | Wide-angle | 10-24mm | Long exposure times, sharp focus, long exposure, smooth water or clouds |
Example Prompt: A woman, 35mm portrait, blue and grey duotones
Example Prompt: leaf of a prayer plant, macro lens, 60mm
Example Prompt: a winning touchdown, fast shutter speed, movement tracking
Example Prompt: an expansive mountain range, landscape wide angle 10mm
</Imagen_prompt_guide>)"sv;

}  // namespace imagen::internal
